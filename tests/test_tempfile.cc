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

#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <mutex>
#include <csignal>
#include <optional>
#include <set>
#include <stdexcept>
#include <sys/resource.h>
#include <sys/stat.h>
#include <thread>
#include <vector>

#include <libwarden/ingest/tempfile.hpp>

#include "helpers.hpp"

using libwarden::ingest::SecureTempFile;
using libwarden::ingest::TempFileError;
using warden_test::ScopedTempDir;

namespace
{

auto read_back(const fs::path& path) -> ByteBuffer
{
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

auto mode_of(const fs::path& path) -> mode_t
{
  struct stat st{};
  EXPECT_EQ(::stat(path.c_str(), &st), 0);
  return st.st_mode & 0777;
}

// Caps the size of any file this process writes, SIGXFSZ is ignored so write() fails with EFBIG
class FileSizeLimit
{
public:
  explicit FileSizeLimit(rlim_t bytes) : m_previous_handler(std::signal(SIGXFSZ, SIG_IGN))
  {
    EXPECT_EQ(::getrlimit(RLIMIT_FSIZE, &m_previous), 0);
    rlimit capped   = m_previous;
    capped.rlim_cur = bytes;
    EXPECT_EQ(::setrlimit(RLIMIT_FSIZE, &capped), 0);
  }

  ~FileSizeLimit()
  {
    ::setrlimit(RLIMIT_FSIZE, &m_previous);
    std::signal(SIGXFSZ, m_previous_handler);
  }

  FileSizeLimit(const FileSizeLimit&)                    = delete;
  auto operator=(const FileSizeLimit&) -> FileSizeLimit& = delete;

private:
  rlimit m_previous{};
  void (*m_previous_handler)(int);
};

} // namespace

TEST(TempFileTest, ContainsExactlyTheAcceptedBytes)
{
  ScopedTempDir dir;
  ByteBuffer    payload = warden_test::wav_payload(4096);
  payload[100]          = 0;
  payload[200]          = 0xFF;

  const auto file = SecureTempFile::create(dir.path(), "warden_audio_", ".wav", payload);
  EXPECT_TRUE(file.owns());
  EXPECT_EQ(file.size(), payload.size());
  EXPECT_EQ(read_back(file.path()), payload);
}

TEST(TempFileTest, NameUsesPrefixRandomPartAndExtension)
{
  ScopedTempDir dir;
  const auto    payload = warden_test::mp3_payload();

  const auto file = SecureTempFile::create(dir.path(), "warden_audio_", ".mp3", payload);
  const auto name = file.path().filename().string();

  EXPECT_EQ(file.path().parent_path(), dir.path());
  EXPECT_TRUE(name.starts_with("warden_audio_"));
  EXPECT_TRUE(name.ends_with(".mp3"));
  // 32 hex characters between prefix and extension
  EXPECT_EQ(name.size(), std::string("warden_audio_").size() + 32 + 4);
}

TEST(TempFileTest, CreatedOwnerOnlyRegardlessOfUmask)
{
  ScopedTempDir dir;
  const auto    payload = warden_test::mp3_payload();

  const mode_t previous = ::umask(0);
  const auto   file     = SecureTempFile::create(dir.path(), "p_", ".mp3", payload);
  ::umask(previous);

  EXPECT_EQ(mode_of(file.path()), static_cast<mode_t>(0600));
}

TEST(TempFileTest, CreatesMissingDirectory)
{
  ScopedTempDir dir;
  const auto    nested = dir.path() / "a" / "b";

  const auto file = SecureTempFile::create(nested, "p_", ".wav", warden_test::wav_payload());
  EXPECT_TRUE(fs::exists(file.path()));
}

TEST(TempFileTest, DestructorRemovesFile)
{
  ScopedTempDir dir;
  fs::path      path;
  {
    const auto file = SecureTempFile::create(dir.path(), "p_", ".wav", warden_test::wav_payload());
    path            = file.path();
    ASSERT_TRUE(fs::exists(path));
  }
  EXPECT_FALSE(fs::exists(path));
  EXPECT_EQ(warden_test::count_entries(dir.path()), 0u);
}

TEST(TempFileTest, ReleaseRemovesEarlyAndOnlyOnce)
{
  ScopedTempDir dir;
  auto          file = SecureTempFile::create(dir.path(), "p_", ".wav", warden_test::wav_payload());
  const auto    path = file.path();

  EXPECT_TRUE(file.release());
  EXPECT_FALSE(fs::exists(path));
  EXPECT_FALSE(file.owns());
  EXPECT_TRUE(file.release());
}

TEST(TempFileTest, MoveTransfersOwnership)
{
  ScopedTempDir dir;
  fs::path      path;
  {
    auto first = SecureTempFile::create(dir.path(), "p_", ".wav", warden_test::wav_payload());
    path       = first.path();
    {
      SecureTempFile second = std::move(first);
      EXPECT_FALSE(first.owns());
      EXPECT_TRUE(second.owns());
    }
    // `second` is gone, so is the file, and `first` has nothing left to remove
    EXPECT_FALSE(fs::exists(path));
  }
  EXPECT_EQ(warden_test::count_entries(dir.path()), 0u);
}

TEST(TempFileTest, MoveAssignmentReleasesPreviousFile)
{
  ScopedTempDir dir;
  auto          a      = SecureTempFile::create(dir.path(), "a_", ".wav", warden_test::wav_payload());
  auto          b      = SecureTempFile::create(dir.path(), "b_", ".wav", warden_test::wav_payload());
  const auto    a_path = a.path();
  const auto    b_path = b.path();

  a = std::move(b);
  EXPECT_FALSE(fs::exists(a_path));
  EXPECT_TRUE(fs::exists(b_path));
  EXPECT_EQ(a.path(), b_path);
}

TEST(TempFileTest, RemovedDuringExceptionUnwinding)
{
  ScopedTempDir dir;
  fs::path      path;

  EXPECT_THROW(
    {
      const auto file =
        SecureTempFile::create(dir.path(), "p_", ".wav", warden_test::wav_payload());
      path = file.path();
      throw std::runtime_error("downstream blew up");
    },
    std::runtime_error);

  EXPECT_FALSE(path.empty());
  EXPECT_FALSE(fs::exists(path));
}

TEST(TempFileTest, UnusableDirectoryThrowsAndLeavesNothing)
{
  ScopedTempDir dir;
  const auto    blocker = dir.path() / "not_a_dir";
  std::ofstream(blocker) << "x";

  EXPECT_THROW(SecureTempFile::create(blocker, "p_", ".wav", warden_test::wav_payload()),
               TempFileError);
  EXPECT_EQ(warden_test::count_entries(dir.path()), 1u);
}

TEST(TempFileTest, FailedWriteRemovesPartialFile)
{
  ScopedTempDir              dir;
  const auto                 payload = warden_test::wav_payload(8 * 1024);
  std::optional<std::string> error;

  {
    // Nothing but the create call runs under the limit, gtest output included
    FileSizeLimit limit(1000);
    try
    {
      auto file = SecureTempFile::create(dir.path(), "p_", ".wav", payload);
    }
    catch (const TempFileError& e)
    {
      error = e.what();
    }
  }

  ASSERT_TRUE(error.has_value());
  EXPECT_NE(error->find("write failed"), std::string::npos);
  EXPECT_EQ(warden_test::count_entries(dir.path()), 0u);
}

TEST(TempFileTest, ConcurrentCreatesNeverSharePaths)
{
  ScopedTempDir dir;
  const auto    payload = warden_test::wav_payload(256);

  constexpr int kThreads = 8;
  constexpr int kEach    = 25;

  std::mutex               mutex;
  std::set<std::string>    seen;
  std::vector<std::thread> workers;

  for (int t = 0; t < kThreads; ++t)
  {
    workers.emplace_back(
      [&]
      {
        std::vector<SecureTempFile> held;
        for (int i = 0; i < kEach; ++i)
          held.push_back(SecureTempFile::create(dir.path(), "same_", ".wav", payload));

        std::lock_guard lock(mutex);
        for (const auto& f : held)
          seen.insert(f.path().string());
      });
  }
  for (auto& w : workers)
    w.join();

  EXPECT_EQ(seen.size(), static_cast<std::size_t>(kThreads * kEach));
  EXPECT_EQ(warden_test::count_entries(dir.path()), 0u);
}
