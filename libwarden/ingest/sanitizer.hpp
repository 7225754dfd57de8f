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

#include <ostream>
#include <string>
#include <string_view>

#include <libwarden/common/api/entry.hpp>
#include <libwarden/common/macros.hpp>
#include <libwarden/ingest/verdict.hpp>

namespace libwarden::ingest
{

class SanitizedFilename;

/*
 * Turns an untrusted upload filename into a SanitizedFilename or rejects it (PathTraversal).
 *
 * Accepted names are returned unchanged, they are never "fixed up": a client that sent a path,
 * a dotfile, a control character or anything outside [A-Za-z0-9._-] gets rejected instead.
 */
WARDEN_API auto sanitize_filename(std::string_view raw,
                                  std::size_t      max_len = WARDEN_MAX_FILENAME_LENGTH)
  -> Verdict<SanitizedFilename>;

// Immutable basename that passed the whitelist. Only sanitize_filename can create one.
class SanitizedFilename
{
public:
  [[nodiscard]] auto str() const noexcept -> const std::string& { return m_name; }
  [[nodiscard]] auto view() const noexcept -> std::string_view { return m_name; }

  auto operator==(const SanitizedFilename& other) const -> bool = default;

private:
  explicit SanitizedFilename(std::string name) : m_name(std::move(name)) {}

  friend auto sanitize_filename(std::string_view raw, std::size_t max_len)
    -> Verdict<SanitizedFilename>;

  std::string m_name;
};

inline auto operator<<(std::ostream& os, const SanitizedFilename& name) -> std::ostream&
{
  return os << name.str();
}

} // namespace libwarden::ingest
