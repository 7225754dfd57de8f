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

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <libwarden/common/types.hpp>

/*
 * SECURE TEMP FILE
 *
 * Owns exactly one file on disk that holds an accepted upload while a collaborator reads it.
 *
 *   - name:        <prefix><random uuid hex><ext>, never a counter
 *   - creation:    O_CREAT | O_EXCL | O_NOFOLLOW, mode 0600 (fchmod'ed again so umask cannot widen it)
 *   - content:     the full payload, fsync'ed before create() returns
 *   - teardown:    the destructor removes the file, moved-from objects own nothing
 *
 * create() throws TempFileError, and it has already unlinked any partial file by then.
 *
 */

namespace fs = std::filesystem;

namespace libwarden::ingest
{

class TempFileError : public std::runtime_error
{
public:
  explicit TempFileError(const std::string& what) : std::runtime_error(what) {}
};

class SecureTempFile
{
public:
  static auto create(const fs::path& dir, std::string_view prefix, std::string_view ext,
                     ByteView bytes) -> SecureTempFile;

  SecureTempFile(const SecureTempFile&)                    = delete;
  auto operator=(const SecureTempFile&) -> SecureTempFile& = delete;

  SecureTempFile(SecureTempFile&& other) noexcept;
  auto operator=(SecureTempFile&& other) noexcept -> SecureTempFile&;

  ~SecureTempFile();

  [[nodiscard]] auto path() const noexcept -> const fs::path& { return m_path; }
  [[nodiscard]] auto size() const noexcept -> ByteCount { return m_size; }
  [[nodiscard]] auto owns() const noexcept -> bool { return m_owned; }

  // Removes the file now. True when the file is gone afterwards (or nothing was owned).
  auto release() noexcept -> bool;

private:
  SecureTempFile(fs::path path, ByteCount size)
      : m_path(std::move(path)), m_size(size), m_owned(true)
  {
  }

  fs::path  m_path;
  ByteCount m_size  = 0;
  bool      m_owned = false;
};

} // namespace libwarden::ingest
