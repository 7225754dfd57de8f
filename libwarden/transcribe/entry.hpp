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

#include <libwarden/common/types.hpp>

namespace libwarden::transcribe
{

// `status` uses HTTP semantics so retry policies can treat every collaborator alike
class TranscriptionError : public std::runtime_error
{
public:
  TranscriptionError(const std::string& what, int status)
      : std::runtime_error(what), m_status(status)
  {
  }

  [[nodiscard]] auto status() const noexcept -> int { return m_status; }

  // 429 and every 5xx are worth another attempt, the rest will fail the same way again
  [[nodiscard]] auto retryable() const noexcept -> bool
  {
    return m_status == 429 || (m_status >= 500 && m_status <= 599);
  }

private:
  int m_status;
};

/*
 * Anything that turns a validated, staged audio file into text.
 *
 * The path handed in is owned by a SecureTempFile: implementations read it, they never
 * move, rename or delete it.
 */
class Transcriber
{
public:
  virtual ~Transcriber() = default;

  virtual auto transcribe(const std::filesystem::path& audio) -> Transcript = 0;
};

} // namespace libwarden::transcribe
