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

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include <libwarden/common/macros.hpp>

namespace libwarden::utils
{

inline constexpr std::string_view LOG_SAFE_ELLIPSIS = "...";

/*
 * Renders untrusted text harmless for a log line:
 *
 *   - every control character (< 0x20 and 0x7F, this includes \r \n \t and ESC) becomes '_'
 *   - anything longer than `max_len` is cut and suffixed with "..."
 *
 * Use this for EVERY request derived value that ends up in a log record.
 */
inline auto log_safe(std::string_view input, std::size_t max_len = WARDEN_MAX_FILENAME_LENGTH)
  -> std::string
{
  std::string out;
  out.reserve(std::min(input.size(), max_len) + LOG_SAFE_ELLIPSIS.size());

  for (char c : input.substr(0, std::min(input.size(), max_len)))
  {
    const auto uc = static_cast<unsigned char>(c);
    out.push_back((uc < 0x20 || uc == 0x7F) ? '_' : c);
  }

  if (input.size() > max_len)
    out.append(LOG_SAFE_ELLIPSIS);

  return out;
}

inline auto to_lower_ascii(std::string_view input) -> std::string
{
  std::string out(input);
  std::ranges::for_each(out, [](char& c) { c = std::tolower(static_cast<unsigned char>(c)); });
  return out;
}

inline auto trim(std::string_view input) -> std::string_view
{
  const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

  while (!input.empty() && is_space(input.front()))
    input.remove_prefix(1);
  while (!input.empty() && is_space(input.back()))
    input.remove_suffix(1);

  return input;
}

inline auto starts_with_icase(std::string_view haystack, std::string_view prefix) -> bool
{
  if (haystack.size() < prefix.size())
    return false;

  return std::equal(prefix.begin(), prefix.end(), haystack.begin(),
                    [](char a, char b)
                    {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

} // namespace libwarden::utils
