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

#include <libwarden/common/macros.hpp>
#include <libwarden/ingest/extension.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/utils/string/entry.hpp>

namespace libwarden::ingest
{

auto default_extension_set() -> const ExtensionSet&
{
  static const ExtensionSet defaults = {
    macros::to_string(macros::MP3_FILE_EXT),  macros::to_string(macros::WAV_FILE_EXT),
    macros::to_string(macros::WEBM_FILE_EXT), macros::to_string(macros::M4A_FILE_EXT),
    macros::to_string(macros::OGG_FILE_EXT),  macros::to_string(macros::FLAC_FILE_EXT),
  };
  return defaults;
}

auto validate_extension(const SanitizedFilename& name, const ExtensionSet& allowed)
  -> Verdict<ExtensionToken>
{
  const auto dot = name.view().rfind('.');

  if (dot == std::string_view::npos || dot + 1 == name.view().size())
  {
    log::WARN<log::EXTENSION>("'%1%' has no extension", name);
    return reject(RejectKind::MissingExtension, "no extension");
  }

  Extension ext = utils::to_lower_ascii(name.view().substr(dot));

  if (!allowed.contains(ext))
  {
    log::WARN<log::EXTENSION>("'%1%' carries unsupported extension '%2%'", name, ext);
    return reject(RejectKind::UnsupportedExtension, "extension " + ext + " not allowed");
  }

  log::TRACE<log::EXTENSION>("'%1%' -> extension %2%", name, ext);
  return ExtensionToken(std::move(ext));
}

} // namespace libwarden::ingest
