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

#include <algorithm>
#include <array>
#include <libwarden/ingest/scanner.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/utils/math/entry.hpp>
#include <libwarden/utils/string/entry.hpp>

namespace libwarden::ingest
{

using namespace std::string_view_literals;

namespace
{

struct BytePattern
{
  std::string_view bytes;
  FindingKind      kind;
  bool             anchored; // only at offset 0
  bool             icase = false;
};

// Two byte magics are far too common inside compressed audio to be searched anywhere
constexpr std::array<BytePattern, 17> PATTERN_TABLE = {{
  {"MZ"sv, FindingKind::ExecutableHeader, true},
  {"\x7F"
   "ELF"sv,
   FindingKind::ExecutableHeader, false},
  {"\xFE\xED\xFA\xCE"sv, FindingKind::ExecutableHeader, false},
  {"\xFE\xED\xFA\xCF"sv, FindingKind::ExecutableHeader, false},
  {"\xCE\xFA\xED\xFE"sv, FindingKind::ExecutableHeader, false},
  {"\xCF\xFA\xED\xFE"sv, FindingKind::ExecutableHeader, false},
  {"\xCA\xFE\xBA\xBE"sv, FindingKind::ExecutableHeader, false},
  {"#!/bin/"sv, FindingKind::ScriptShebang, false},
  {"#!/usr/bin/"sv, FindingKind::ScriptShebang, false},
  {"<script"sv, FindingKind::EmbeddedMarkup, false, true},
  {"<?php"sv, FindingKind::EmbeddedMarkup, false},
  {"PK\x03\x04"sv, FindingKind::ArchiveSignature, false},
  {"Rar!\x1A\x07"sv, FindingKind::ArchiveSignature, false},
  {"\x1F\x8B"sv, FindingKind::ArchiveSignature, true},
  {"eval("sv, FindingKind::SuspiciousCall, false},
  {"system("sv, FindingKind::SuspiciousCall, false},
  {"exec("sv, FindingKind::SuspiciousCall, false},
}};

auto find_pattern(std::string_view window, const BytePattern& pattern) -> std::optional<ByteOffset>
{
  if (pattern.anchored)
  {
    if (window.starts_with(pattern.bytes))
      return 0;
    return std::nullopt;
  }

  if (!pattern.icase)
  {
    const auto pos = window.find(pattern.bytes);
    return pos == std::string_view::npos ? std::nullopt : std::optional<ByteOffset>(pos);
  }

  for (std::size_t pos = 0; pos + pattern.bytes.size() <= window.size(); ++pos)
  {
    if (utils::starts_with_icase(window.substr(pos), pattern.bytes))
      return pos;
  }
  return std::nullopt;
}

} // namespace

auto to_string(FindingCategory category) -> std::string_view
{
  return category == FindingCategory::Signature ? "signature" : "anomaly";
}

auto to_string(FindingKind kind) -> std::string_view
{
  switch (kind)
  {
    case FindingKind::ExecutableHeader:
      return "ExecutableHeader";
    case FindingKind::ScriptShebang:
      return "ScriptShebang";
    case FindingKind::EmbeddedMarkup:
      return "EmbeddedMarkup";
    case FindingKind::ArchiveSignature:
      return "ArchiveSignature";
    case FindingKind::SuspiciousCall:
      return "SuspiciousCall";
    case FindingKind::NullByteRatio:
      return "NullByteRatio";
    case FindingKind::LongLine:
      return "LongLine";
  }

  return "Unknown";
}

auto to_string(HeuristicAction action) -> std::string_view
{
  switch (action)
  {
    case HeuristicAction::Ignore:
      return "ignore";
    case HeuristicAction::Warn:
      return "warn";
    case HeuristicAction::Reject:
      return "reject";
  }

  return "unknown";
}

auto parse_heuristic_action(std::string_view text) -> std::optional<HeuristicAction>
{
  const auto lowered = utils::to_lower_ascii(utils::trim(text));

  if (lowered == "ignore")
    return HeuristicAction::Ignore;
  if (lowered == "warn")
    return HeuristicAction::Warn;
  if (lowered == "reject")
    return HeuristicAction::Reject;

  return std::nullopt;
}

auto ScanReport::has(FindingKind kind) const -> bool
{
  return std::ranges::any_of(findings, [kind](const Finding& f) { return f.kind == kind; });
}

auto ScanReport::count(FindingCategory category) const -> std::size_t
{
  return static_cast<std::size_t>(std::ranges::count_if(
    findings, [category](const Finding& f) { return f.category == category; }));
}

auto scan(ByteView payload, const ScanOptions& options) -> ScanReport
{
  ScanReport report;
  report.window = std::min(payload.size(), options.window);

  const std::string_view window{reinterpret_cast<const char*>(payload.data()), report.window};

  for (const auto& pattern : PATTERN_TABLE)
  {
    if (const auto offset = find_pattern(window, pattern))
    {
      report.findings.push_back({FindingCategory::Signature, pattern.kind, *offset});
    }
  }

  std::size_t current_line = 0;
  ByteOffset  line_start   = 0;
  ByteOffset  longest_at   = 0;

  for (std::size_t i = 0; i < window.size(); ++i)
  {
    const char c = window[i];

    if (c == '\0')
      ++report.null_bytes;

    if (c == '\n' || c == '\r')
    {
      current_line = 0;
      line_start   = i + 1;
      continue;
    }

    if (++current_line > report.longest_line)
    {
      report.longest_line = current_line;
      longest_at          = line_start;
    }
  }

  if (utils::math::ratio(report.null_bytes, report.window) > options.null_ratio_threshold)
  {
    report.findings.push_back({FindingCategory::Anomaly, FindingKind::NullByteRatio, 0});
  }

  if (report.longest_line > options.max_line_length)
  {
    report.findings.push_back({FindingCategory::Anomaly, FindingKind::LongLine, longest_at});
  }

  for (const auto& finding : report.findings)
  {
    log::DBG<log::SCANNER>("%1% finding %2% at offset %3%", to_string(finding.category),
                           finding.kind, finding.offset);
  }

  return report;
}

} // namespace libwarden::ingest
