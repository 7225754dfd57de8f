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
#include <libwarden/ingest/signature.hpp>
#include <libwarden/log-macros.hpp>

namespace libwarden::ingest
{

namespace
{

constexpr std::string_view WAVE_TAG    = "WAVE";
constexpr std::string_view FTYP_TAG    = "ftyp";
constexpr std::size_t      WAVE_OFFSET = 8;

auto as_chars(ByteView payload) -> std::string_view
{
  return {reinterpret_cast<const char*>(payload.data()), payload.size()};
}

auto passes_deep_check(const SignatureRecord& record, std::string_view bytes) -> bool
{
  switch (record.check)
  {
    case DeepCheck::None:
      return true;

    case DeepCheck::RiffWave:
      return bytes.size() >= WAVE_OFFSET + WAVE_TAG.size() &&
             bytes.substr(WAVE_OFFSET, WAVE_TAG.size()) == WAVE_TAG;

    case DeepCheck::IsoBmffFtyp:
      return bytes.substr(0, WARDEN_DEEP_CHECK_WINDOW).find(FTYP_TAG) != std::string_view::npos;

    case DeepCheck::MatroskaLength:
      return bytes.size() > WARDEN_DEEP_CHECK_WINDOW;
  }

  return false;
}

} // namespace

auto to_string(AudioFormat format) -> std::string_view
{
  switch (format)
  {
    case AudioFormat::MP3:
      return "MP3";
    case AudioFormat::WAV:
      return "WAV";
    case AudioFormat::OGG:
      return "OGG";
    case AudioFormat::FLAC:
      return "FLAC";
    case AudioFormat::M4A:
      return "M4A";
    case AudioFormat::MP4:
      return "MP4";
    case AudioFormat::WEBM:
      return "WEBM";
  }

  return "UNKNOWN";
}

auto match_signature(ByteView payload) -> const SignatureRecord*
{
  const auto bytes = as_chars(payload);

  const auto it = std::ranges::find_if(SIGNATURE_TABLE, [&](const SignatureRecord& record)
                                       { return bytes.starts_with(record.magic); });

  return it == SIGNATURE_TABLE.end() ? nullptr : &*it;
}

auto validate_signature(ByteView payload, const ExtensionToken& ext, std::size_t min_size)
  -> Verdict<AudioFormat>
{
  if (payload.size() < min_size)
  {
    log::WARN<log::SIGNATURE>("Payload of %1% bytes is below the %2% byte minimum",
                              payload.size(), min_size);
    return reject(RejectKind::ContentMismatch, "payload too small");
  }

  const SignatureRecord* record = match_signature(payload);
  if (!record)
  {
    log::WARN<log::SIGNATURE>("No known audio signature for a %1% upload", ext);
    return reject(RejectKind::UnrecognizedContent, "no signature matched");
  }

  if (!passes_deep_check(*record, as_chars(payload)))
  {
    log::WARN<log::SIGNATURE>("%1% magic matched but the deep check failed", record->format);
    return reject(RejectKind::ContentMismatch, "deep check failed");
  }

  if (ext != record->extension)
  {
    log::WARN<log::SIGNATURE>("Content is %1% (%2%) but the upload claims %3%", record->format,
                              record->extension, ext);
    return reject(RejectKind::ContentMismatch, "signature does not match extension");
  }

  log::DBG<log::SIGNATURE>("Signature confirmed: %1%", record->format);
  return record->format;
}

} // namespace libwarden::ingest
