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

#include <array>
#include <ostream>
#include <string_view>

#include <libwarden/common/api/entry.hpp>
#include <libwarden/common/macros.hpp>
#include <libwarden/common/types.hpp>
#include <libwarden/ingest/extension.hpp>

/*
 * CONTENT SIGNATURE VALIDATOR
 *
 * The extension only sets an expectation, the bytes have the final say.
 *
 * The table below is ordered: the FIRST record whose magic matches at offset 0 is the only
 * candidate, no later record is ever consulted. That is why the specific ISO-BMFF brands sit
 * before the generic `00 00 00` record.
 *
 */

namespace libwarden::ingest
{

using namespace std::string_view_literals;

enum class AudioFormat
{
  MP3,
  WAV,
  OGG,
  FLAC,
  M4A,
  MP4,
  WEBM
};

WARDEN_API auto to_string(AudioFormat format) -> std::string_view;

inline auto operator<<(std::ostream& os, AudioFormat format) -> std::ostream&
{
  return os << to_string(format);
}

enum class DeepCheck
{
  None,
  RiffWave,      // bytes 8..11 spell WAVE
  IsoBmffFtyp,   // `ftyp` somewhere in the first WARDEN_DEEP_CHECK_WINDOW bytes
  MatroskaLength // payload longer than WARDEN_DEEP_CHECK_WINDOW bytes
};

struct SignatureRecord
{
  std::string_view magic;
  AudioFormat      format;
  std::string_view extension;
  DeepCheck        check;
};

// NOTE: literals are split where a hex escape would otherwise swallow the following letters
inline constexpr std::array<SignatureRecord, 12> SIGNATURE_TABLE = {{
  {"\xFF\xFB"sv, AudioFormat::MP3, macros::MP3_FILE_EXT, DeepCheck::None},
  {"\xFF\xFA"sv, AudioFormat::MP3, macros::MP3_FILE_EXT, DeepCheck::None},
  {"\xFF\xF3"sv, AudioFormat::MP3, macros::MP3_FILE_EXT, DeepCheck::None},
  {"\xFF\xF2"sv, AudioFormat::MP3, macros::MP3_FILE_EXT, DeepCheck::None},
  {"ID3"sv, AudioFormat::MP3, macros::MP3_FILE_EXT, DeepCheck::None},
  {"RIFF"sv, AudioFormat::WAV, macros::WAV_FILE_EXT, DeepCheck::RiffWave},
  {"OggS"sv, AudioFormat::OGG, macros::OGG_FILE_EXT, DeepCheck::None},
  {"fLaC"sv, AudioFormat::FLAC, macros::FLAC_FILE_EXT, DeepCheck::None},
  {"\x00\x00\x00\x20"
   "ftypM4A"sv,
   AudioFormat::M4A, macros::M4A_FILE_EXT, DeepCheck::None},
  {"\x00\x00\x00\x18"
   "ftypmp42"sv,
   AudioFormat::MP4, macros::MP4_FILE_EXT, DeepCheck::None},
  {"\x00\x00\x00"sv, AudioFormat::M4A, macros::M4A_FILE_EXT, DeepCheck::IsoBmffFtyp},
  {"\x1A\x45\xDF\xA3"sv, AudioFormat::WEBM, macros::WEBM_FILE_EXT, DeepCheck::MatroskaLength},
}};

// First record whose magic is a prefix of `payload`, nullptr when none is
WARDEN_API auto match_signature(ByteView payload) -> const SignatureRecord*;

/*
 * Accepted -> the detected AudioFormat, which agrees with `ext`
 *
 * ContentMismatch     -> too small, deep check failed or the detected format wants another extension
 * UnrecognizedContent -> no magic matched (the extension is never used as a fallback)
 *
 * Total over every byte string: no input makes it throw.
 */
WARDEN_API auto validate_signature(ByteView payload, const ExtensionToken& ext,
                                   std::size_t min_size = WARDEN_MIN_PAYLOAD_SIZE)
  -> Verdict<AudioFormat>;

} // namespace libwarden::ingest
