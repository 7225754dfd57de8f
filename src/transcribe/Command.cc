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
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <libwarden/common/macros.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/transcribe/command.hpp>
#include <libwarden/utils/string/entry.hpp>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace libwarden::transcribe
{

namespace
{

constexpr int EXIT_TEMPFAIL = 75; // sysexits.h EX_TEMPFAIL

constexpr int STATUS_UNPROCESSABLE = 422;
constexpr int STATUS_INTERNAL      = 500;
constexpr int STATUS_UNAVAILABLE   = 503;

// Owns the spawn file actions for the lifetime of one posix_spawnp call
class SpawnActions
{
public:
  SpawnActions() { ::posix_spawn_file_actions_init(&m_actions); }
  ~SpawnActions() { ::posix_spawn_file_actions_destroy(&m_actions); }

  SpawnActions(const SpawnActions&)                    = delete;
  auto operator=(const SpawnActions&) -> SpawnActions& = delete;

  auto get() -> posix_spawn_file_actions_t* { return &m_actions; }

private:
  posix_spawn_file_actions_t m_actions{};
};

void close_quietly(int& fd)
{
  if (fd >= 0)
  {
    ::close(fd);
    fd = -1;
  }
}

auto wait_for(pid_t pid) -> int
{
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0)
  {
    if (errno != EINTR)
      throw TranscriptionError(std::string("waitpid failed: ") + std::strerror(errno),
                               STATUS_INTERNAL);
  }
  return status;
}

} // namespace

CommandTranscriber::CommandTranscriber(std::vector<std::string> argv) : m_argv(std::move(argv))
{
  if (m_argv.empty() || m_argv.front().empty())
    throw std::invalid_argument("transcriber command must name a program");
}

auto CommandTranscriber::argv_for(const std::filesystem::path& audio) const
  -> std::vector<std::string>
{
  std::vector<std::string> argv = m_argv;
  bool                     used = false;

  for (auto& arg : argv)
  {
    std::size_t pos = 0;
    while ((pos = arg.find(macros::TRANSCRIBER_INPUT_PLACEHOLDER, pos)) != std::string::npos)
    {
      arg.replace(pos, macros::TRANSCRIBER_INPUT_PLACEHOLDER.size(), audio.string());
      pos += audio.string().size();
      used = true;
    }
  }

  if (!used)
    argv.push_back(audio.string());

  return argv;
}

auto CommandTranscriber::transcribe(const std::filesystem::path& audio) -> Transcript
{
  const auto argv = argv_for(audio);

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  std::array<int, 2> out{-1, -1};
  if (::pipe2(out.data(), O_CLOEXEC) != 0)
    throw TranscriptionError(std::string("pipe failed: ") + std::strerror(errno),
                             STATUS_UNAVAILABLE);

  SpawnActions actions;
  ::posix_spawn_file_actions_adddup2(actions.get(), out[1], STDOUT_FILENO);
  ::posix_spawn_file_actions_addopen(actions.get(), STDERR_FILENO, "/dev/null", O_WRONLY, 0);

  pid_t     pid = -1;
  const int rc  = ::posix_spawnp(&pid, c_argv[0], actions.get(), nullptr, c_argv.data(), environ);

  close_quietly(out[1]);

  if (rc != 0)
  {
    close_quietly(out[0]);
    log::ERROR<log::TRANSCRIBE>("Cannot start '%1%': %2%", utils::log_safe(argv.front()),
                                std::strerror(rc));
    throw TranscriptionError("transcriber could not be started", STATUS_UNAVAILABLE);
  }

  log::DBG<log::TRANSCRIBE>("Started '%1%' (pid %2%)", utils::log_safe(argv.front()), pid);

  std::string            output;
  std::array<char, 4096> buffer{};

  for (;;)
  {
    const ssize_t n = ::read(out[0], buffer.data(), buffer.size());
    if (n > 0)
    {
      output.append(buffer.data(), static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    break;
  }
  close_quietly(out[0]);

  const int status = wait_for(pid);

  if (WIFSIGNALED(status))
  {
    log::ERROR<log::TRANSCRIBE>("Transcriber killed by signal %1%", WTERMSIG(status));
    throw TranscriptionError("transcriber terminated by signal", STATUS_INTERNAL);
  }

  const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  if (code == EXIT_TEMPFAIL)
  {
    log::WARN<log::TRANSCRIBE>("Transcriber reported a temporary failure");
    throw TranscriptionError("transcriber temporarily unavailable", STATUS_UNAVAILABLE);
  }

  if (code != 0)
  {
    log::ERROR<log::TRANSCRIBE>("Transcriber exited with %1%", code);
    throw TranscriptionError("transcriber failed with exit code " + std::to_string(code),
                             STATUS_UNPROCESSABLE);
  }

  Transcript transcript(utils::trim(output));
  log::INFO<log::TRANSCRIBE>("Transcription produced %1% characters", transcript.size());
  return transcript;
}

} // namespace libwarden::transcribe
