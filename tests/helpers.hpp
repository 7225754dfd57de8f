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

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <string>
#include <string_view>

#include <libwarden/common/types.hpp>
#include <libwarden/ingest/extension.hpp>
#include <libwarden/ingest/sanitizer.hpp>

namespace fs = std::filesystem;

namespace warden_test
{

inline auto bytes(std::string_view text) -> ByteBuffer { return {text.begin(), text.end()}; }

// `head` followed by `fill` up to `total` bytes
inline auto padded(std::string_view head, std::size_t total, char fill = 'U') -> ByteBuffer
{
  ByteBuffer out = bytes(head);
  if (out.size() < total)
    out.resize(total, static_cast<Byte>(fill));
  return out;
}

inline auto wav_payload(std::size_t total = 64) -> ByteBuffer
{
  using namespace std::string_view_literals;
  return padded("RIFF\x24\x00\x00\x00WAVEfmt "sv, total);
}

inline auto mp3_payload(std::size_t total = 20) -> ByteBuffer
{
  using namespace std::string_view_literals;
  return padded("\xFF\xFB\x90\x64"sv, total);
}

inline auto token(std::string_view ext,
                  const libwarden::ingest::ExtensionSet& allowed =
                    libwarden::ingest::default_extension_set()) -> libwarden::ingest::ExtensionToken
{
  const auto name = libwarden::ingest::sanitize_filename("sample" + std::string(ext));
  return libwarden::ingest::validate_extension(name.value(), allowed).value();
}

inline auto count_entries(const fs::path& dir) -> std::size_t
{
  if (!fs::exists(dir))
    return 0;
  return static_cast<std::size_t>(
    std::distance(fs::directory_iterator(dir), fs::directory_iterator{}));
}

// Fresh directory under the system temp dir, removed with everything in it
class ScopedTempDir
{
public:
  ScopedTempDir()
      : m_path(fs::temp_directory_path() /
               ("warden_test_" + boost::uuids::to_string(boost::uuids::random_generator()())))
  {
    fs::create_directories(m_path);
  }

  ~ScopedTempDir()
  {
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }

  ScopedTempDir(const ScopedTempDir&)                    = delete;
  auto operator=(const ScopedTempDir&) -> ScopedTempDir& = delete;

  [[nodiscard]] auto path() const -> const fs::path& { return m_path; }

private:
  fs::path m_path;
};

} // namespace warden_test
