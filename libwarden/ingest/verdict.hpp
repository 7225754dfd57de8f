#pragma once
/********************************************************************************
 *                                Warden Project                                *
 *                        Secure Audio Upload Ingestion                         *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <libwarden/common/api/entry.hpp>

/*
 * VERDICT
 *
 * Every validation stage of the ingest pipeline answers with a Verdict<T>:
 *
 *   Accepted(T)  -> the stage produced a value the next stage may trust
 *   Rejected(R)  -> the stage refused the upload, R says why
 *
 * The `detail` of a Rejection is for OUR logs only. It must already be log-safe when it is
 * constructed and it never leaves the process (see ingest/messages.hpp for what clients get).
 *
 */

namespace libwarden::ingest
{

enum class RejectKind
{
  PathTraversal,
  MissingExtension,
  UnsupportedExtension,
  ContentMismatch,
  UnrecognizedContent,
  SuspiciousContent,
  SizeExceeded,
  TempFileAllocationFailure,
  DownstreamProcessingFailure
};

inline constexpr std::size_t kRejectKindCount =
  static_cast<std::size_t>(RejectKind::DownstreamProcessingFailure) + 1;

WARDEN_API auto to_string(RejectKind kind) -> std::string_view;

inline auto operator<<(std::ostream& os, RejectKind kind) -> std::ostream&
{
  return os << to_string(kind);
}

struct Rejection
{
  RejectKind  kind;
  std::string detail;
};

inline auto reject(RejectKind kind, std::string detail = {}) -> Rejection
{
  return Rejection{kind, std::move(detail)};
}

template <typename T> class Verdict
{
public:
  Verdict(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
  Verdict(Rejection rejection) : m_state(std::in_place_index<1>, std::move(rejection)) {}

  [[nodiscard]] auto ok() const noexcept -> bool { return m_state.index() == 0; }
  explicit operator bool() const noexcept { return ok(); }

  // Only valid when ok(), std::bad_variant_access otherwise
  auto value() & -> T& { return std::get<0>(m_state); }
  auto value() const& -> const T& { return std::get<0>(m_state); }
  auto value() && -> T&& { return std::get<0>(std::move(m_state)); }

  // Only valid when !ok()
  [[nodiscard]] auto rejection() const -> const Rejection& { return std::get<1>(m_state); }
  [[nodiscard]] auto kind() const -> RejectKind { return rejection().kind; }

private:
  std::variant<T, Rejection> m_state;
};

} // namespace libwarden::ingest
