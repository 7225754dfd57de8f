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
#include <libwarden/common/macros.hpp>
#include <libwarden/ingest/mime.hpp>
#include <libwarden/utils/string/entry.hpp>

namespace libwarden::ingest
{

namespace
{

constexpr std::array<std::string_view, 2> MP3_MIMES  = {"audio/mpeg", "audio/mp3"};
constexpr std::array<std::string_view, 4> WAV_MIMES  = {"audio/wav", "audio/wave", "audio/x-wav",
                                                        "audio/vnd.wave"};
constexpr std::array<std::string_view, 2> WEBM_MIMES = {"audio/webm", "video/webm"};
constexpr std::array<std::string_view, 3> MP4_MIMES  = {"audio/mp4", "audio/m4a", "audio/x-m4a"};
constexpr std::array<std::string_view, 2> OGG_MIMES  = {"audio/ogg", "application/ogg"};
constexpr std::array<std::string_view, 2> FLAC_MIMES = {"audio/flac", "audio/x-flac"};

} // namespace

auto parse_base_mime(std::string_view content_type) -> MimeType
{
  const auto semicolon = content_type.find(';');
  if (semicolon != std::string_view::npos)
    content_type = content_type.substr(0, semicolon);

  return utils::to_lower_ascii(utils::trim(content_type));
}

auto mime_types_for(AudioFormat format) -> std::span<const std::string_view>
{
  switch (format)
  {
    case AudioFormat::MP3:
      return MP3_MIMES;
    case AudioFormat::WAV:
      return WAV_MIMES;
    case AudioFormat::WEBM:
      return WEBM_MIMES;
    case AudioFormat::M4A:
    case AudioFormat::MP4:
      return MP4_MIMES;
    case AudioFormat::OGG:
      return OGG_MIMES;
    case AudioFormat::FLAC:
      return FLAC_MIMES;
  }

  return {};
}

auto check_claimed_mime(std::string_view claimed, AudioFormat detected) -> MimeAgreement
{
  const MimeType base = parse_base_mime(claimed);

  if (base.empty() || base == macros::CONTENT_TYPE_OCTET_STREAM)
    return MimeAgreement::NoClaim;

  const auto known = mime_types_for(detected);
  return std::ranges::find(known, base) != known.end() ? MimeAgreement::Match
                                                       : MimeAgreement::Mismatch;
}

} // namespace libwarden::ingest
