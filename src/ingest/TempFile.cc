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
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <libwarden/ingest/tempfile.hpp>
#include <libwarden/log-macros.hpp>
#include <sys/stat.h>
#include <unistd.h>

namespace libwarden::ingest
{

namespace
{

constexpr int    CREATE_ATTEMPTS = 4;
constexpr mode_t OWNER_RW        = S_IRUSR | S_IWUSR; // 0600

auto errno_message(std::string_view what) -> std::string
{
  return std::string(what) + ": " + std::strerror(errno);
}

auto random_hex() -> std::string
{
  std::string id = boost::uuids::to_string(boost::uuids::random_generator()());
  std::erase(id, '-');
  return id;
}

// Writes everything or reports the failing errno. Handles short writes and EINTR.
auto write_all(int fd, ByteView bytes) -> bool
{
  std::size_t written = 0;
  while (written < bytes.size())
  {
    const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0)
    {
      if (errno == EINTR)
        continue;
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

// Closes, unlinks and throws. Keeps the errno of the original failure in the message.
[[noreturn]] void abandon(int fd, const fs::path& path, const std::string& reason)
{
  if (fd >= 0)
    ::close(fd);
  if (::unlink(path.c_str()) != 0 && errno != ENOENT)
  {
    log::ERROR<log::TEMPFILE>("Could not unlink partial temp file %1%: %2%", path.string(),
                              std::strerror(errno));
  }

  log::ERROR<log::TEMPFILE>("Temp file allocation failed: %1%", reason);
  throw TempFileError(reason);
}

} // namespace

auto SecureTempFile::create(const fs::path& dir, std::string_view prefix, std::string_view ext,
                            ByteView bytes) -> SecureTempFile
{
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
  {
    log::ERROR<log::TEMPFILE>("Cannot create temp directory %1%: %2%", dir.string(), ec.message());
    throw TempFileError("cannot create temp directory: " + ec.message());
  }

  fs::path path;
  int      fd = -1;

  for (int attempt = 0; attempt < CREATE_ATTEMPTS && fd < 0; ++attempt)
  {
    try
    {
      path = dir / (std::string(prefix) + random_hex() + std::string(ext));
    }
    catch (const std::exception& e)
    {
      log::ERROR<log::TEMPFILE>("No entropy for a temp file name: %1%", e.what());
      throw TempFileError(std::string("entropy source failed: ") + e.what());
    }

    fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, OWNER_RW);

    if (fd < 0 && errno != EEXIST)
    {
      const std::string reason = errno_message("open failed");
      log::ERROR<log::TEMPFILE>("Could not create %1%: %2%", path.string(), reason);
      throw TempFileError(reason);
    }

    if (fd < 0)
      log::WARN<log::TEMPFILE>("Temp name collision on %1%, retrying", path.string());
  }

  if (fd < 0)
    throw TempFileError("could not find a free temp file name");

  // From here on, every failure has a file on disk that must go away before we throw
  if (::fchmod(fd, OWNER_RW) != 0)
    abandon(fd, path, errno_message("fchmod failed"));

  if (!write_all(fd, bytes))
    abandon(fd, path, errno_message("write failed"));

  if (::fsync(fd) != 0)
    abandon(fd, path, errno_message("fsync failed"));

  if (::close(fd) != 0)
    abandon(-1, path, errno_message("close failed"));

  log::DBG<log::TEMPFILE>("Staged %1% bytes at %2%", bytes.size(), path.string());
  return SecureTempFile(std::move(path), bytes.size());
}

SecureTempFile::SecureTempFile(SecureTempFile&& other) noexcept
    : m_path(std::move(other.m_path)), m_size(other.m_size), m_owned(other.m_owned)
{
  other.m_owned = false;
  other.m_size  = 0;
}

auto SecureTempFile::operator=(SecureTempFile&& other) noexcept -> SecureTempFile&
{
  if (this != &other)
  {
    release();
    m_path        = std::move(other.m_path);
    m_size        = other.m_size;
    m_owned       = other.m_owned;
    other.m_owned = false;
    other.m_size  = 0;
  }
  return *this;
}

SecureTempFile::~SecureTempFile() { release(); }

auto SecureTempFile::release() noexcept -> bool
{
  if (!m_owned)
    return true;

  m_owned = false;

  std::error_code ec;
  fs::remove(m_path, ec);

  if (ec)
  {
    try
    {
      log::ERROR<log::TEMPFILE>("Failed to remove temp file %1%: %2%", m_path.string(),
                                ec.message());
    }
    catch (const std::exception&)
    {
      // logging must never escape a destructor
    }
    return false;
  }

  try
  {
    log::TRACE<log::TEMPFILE>("Removed temp file %1%", m_path.string());
  }
  catch (const std::exception&)
  {
    // logging must never escape a destructor
  }
  return true;
}

} // namespace libwarden::ingest
