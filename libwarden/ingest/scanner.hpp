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

#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include <libwarden/common/api/entry.hpp>
#include <libwarden/common/macros.hpp>
#include <libwarden/common/types.hpp>

/*
 * MALWARE HEURISTIC SCANNER
 *
 * A cheap look at the head of the upload for things that have no business inside audio:
 * executable headers, shebangs, markup, archive magics, call-like tokens and statistical
 * oddities (too many NULs, absurdly long "lines").
 *
 * This is NOT an antivirus. It reports, the pipeline decides (see HeuristicAction).
 *
 */

namespace libwarden::ingest
{

enum class FindingCategory
{
  Signature, // a known byte pattern was found
  Anomaly    // a statistical property is off
};

enum class FindingKind
{
  ExecutableHeader,
  ScriptShebang,
  EmbeddedMarkup,
  ArchiveSignature,
  SuspiciousCall,
  NullByteRatio,
  LongLine
};

WARDEN_API auto to_string(FindingCategory category) -> std::string_view;
WARDEN_API auto to_string(FindingKind kind) -> std::string_view;

inline auto operator<<(std::ostream& os, FindingKind kind) -> std::ostream&
{
  return os << to_string(kind);
}

struct Finding
{
  FindingCategory category;
  FindingKind     kind;
  ByteOffset      offset;
};

struct ScanOptions
{
  std::size_t window               = WARDEN_SCAN_WINDOW;
  double      null_ratio_threshold = 0.5;
  std::size_t max_line_length      = WARDEN_MAX_LINE_LENGTH;
};

struct ScanReport
{
  std::vector<Finding> findings;
  std::size_t          window       = 0; // bytes actually inspected
  std::size_t          null_bytes   = 0;
  std::size_t          longest_line = 0;

  [[nodiscard]] auto suspicious() const noexcept -> bool { return !findings.empty(); }
  [[nodiscard]] auto has(FindingKind kind) const -> bool;
  [[nodiscard]] auto count(FindingCategory category) const -> std::size_t;
};

WARDEN_API auto scan(ByteView payload, const ScanOptions& options = {}) -> ScanReport;

// What the pipeline does with findings of one category
enum class HeuristicAction
{
  Ignore,
  Warn,
  Reject
};

WARDEN_API auto to_string(HeuristicAction action) -> std::string_view;
WARDEN_API auto parse_heuristic_action(std::string_view text) -> std::optional<HeuristicAction>;

} // namespace libwarden::ingest
