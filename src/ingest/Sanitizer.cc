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

#include <libwarden/ingest/sanitizer.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/utils/string/entry.hpp>

namespace libwarden::ingest
{

namespace
{

auto is_whitelisted(char c) -> bool
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' ||
         c == '_' || c == '-';
}

auto refuse(std::string_view raw, std::string_view why) -> Rejection
{
  log::WARN<log::SANITIZE>("Rejected filename '%1%': %2%", utils::log_safe(raw), why);
  return reject(RejectKind::PathTraversal, std::string(why));
}

} // namespace

auto sanitize_filename(std::string_view raw, std::size_t max_len) -> Verdict<SanitizedFilename>
{
  if (raw.empty())
    return refuse(raw, "empty filename");

  // Basename reduction. Both separators count, the name may come from any client OS.
  const auto       last_sep = raw.find_last_of("/\\");
  std::string_view base     = last_sep == std::string_view::npos ? raw : raw.substr(last_sep + 1);

  if (base.empty())
    return refuse(raw, "no basename after the last separator");

  if (base.size() != raw.size())
    return refuse(raw, "directory component present");

  if (base.find("..") != std::string_view::npos)
    return refuse(raw, "parent directory sequence");

  for (char c : base)
  {
    if (c == '\0' || c == '\r' || c == '\n')
      return refuse(raw, "control character");
    if (!is_whitelisted(c))
      return refuse(raw, "character outside whitelist");
  }

  if (base.front() == '.')
    return refuse(raw, "hidden file name");

  if (base.size() > max_len)
    return refuse(raw, "name too long");

  log::TRACE<log::SANITIZE>("Filename '%1%' passed sanitization", base);
  return SanitizedFilename(std::string(base));
}

} // namespace libwarden::ingest
