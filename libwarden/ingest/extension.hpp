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
#include <set>
#include <string>

#include <libwarden/common/api/entry.hpp>
#include <libwarden/common/types.hpp>
#include <libwarden/ingest/sanitizer.hpp>

namespace libwarden::ingest
{

// Lower-cased extensions, each with its leading dot
using ExtensionSet = std::set<Extension>;

WARDEN_API auto default_extension_set() -> const ExtensionSet&;

class ExtensionToken;

/*
 * Derives the ExtensionToken from a sanitized name. Never consults the claimed MIME type.
 *
 * MissingExtension      -> no dot at all or the dot is the last character
 * UnsupportedExtension  -> the lower-cased suffix is not in `allowed`
 */
WARDEN_API auto validate_extension(const SanitizedFilename& name, const ExtensionSet& allowed)
  -> Verdict<ExtensionToken>;

class ExtensionToken
{
public:
  [[nodiscard]] auto str() const noexcept -> const Extension& { return m_ext; }

  auto operator==(const ExtensionToken& other) const -> bool = default;
  auto operator==(std::string_view ext) const -> bool { return m_ext == ext; }

private:
  explicit ExtensionToken(Extension ext) : m_ext(std::move(ext)) {}

  friend auto validate_extension(const SanitizedFilename& name, const ExtensionSet& allowed)
    -> Verdict<ExtensionToken>;

  Extension m_ext;
};

inline auto operator<<(std::ostream& os, const ExtensionToken& ext) -> std::ostream&
{
  return os << ext.str();
}

} // namespace libwarden::ingest
