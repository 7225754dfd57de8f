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

#include <span>
#include <string_view>

#include <libwarden/common/api/entry.hpp>
#include <libwarden/common/types.hpp>
#include <libwarden/ingest/signature.hpp>

namespace libwarden::ingest
{

// RFC 2046 base type: parameters after ';' dropped, surrounding whitespace trimmed, lower-cased.
// "Audio/WAV; codecs=1" -> "audio/wav"
WARDEN_API auto parse_base_mime(std::string_view content_type) -> MimeType;

// Registered MIME types for a detected format
WARDEN_API auto mime_types_for(AudioFormat format) -> std::span<const std::string_view>;

enum class MimeAgreement
{
  NoClaim,  // empty or application/octet-stream
  Match,
  Mismatch
};

WARDEN_API auto check_claimed_mime(std::string_view claimed, AudioFormat detected) -> MimeAgreement;

} // namespace libwarden::ingest
