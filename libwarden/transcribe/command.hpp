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

#include <string>
#include <vector>

#include <libwarden/transcribe/entry.hpp>

namespace libwarden::transcribe
{

/*
 * Runs an external speech-to-text program (whisper-cli, a wrapper script, ...).
 *
 *   argv       -> no shell, `{input}` is replaced by the audio path (appended when absent)
 *   stdout     -> transcript, surrounding whitespace trimmed
 *
 *   exit 0             -> transcript
 *   exit 75 (TEMPFAIL) -> TranscriptionError 503
 *   killed by signal   -> TranscriptionError 500
 *   any other exit     -> TranscriptionError 422
 *   cannot spawn       -> TranscriptionError 503
 */
class CommandTranscriber : public Transcriber
{
public:
  explicit CommandTranscriber(std::vector<std::string> argv);

  auto transcribe(const std::filesystem::path& audio) -> Transcript override;

  [[nodiscard]] auto argv_for(const std::filesystem::path& audio) const
    -> std::vector<std::string>;

private:
  std::vector<std::string> m_argv;
};

} // namespace libwarden::transcribe
