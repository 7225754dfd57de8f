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
#include <string_view>

enum Macros
{
  WARDEN_MAX_FILENAME_LENGTH = 255,  // bytes, basename only
  WARDEN_MIN_PAYLOAD_SIZE    = 20,   // smallest payload that can carry a container header
  WARDEN_SCAN_WINDOW         = 1024, // heuristic scanner only ever looks at this many bytes
  WARDEN_MAX_LINE_LENGTH     = 800,  // longest run between line breaks before it is an anomaly
  WARDEN_DEEP_CHECK_WINDOW   = 32,   // `ftyp` search window and minimum WebM payload size
  WARDEN_UPLOAD_SIZE_LIMIT   = 25    // in MiBs
};

#define WARDEN_RET_SUC   0
#define WARDEN_RET_FAIL  1
#define WARDEN_RET_USAGE 2

#define STRING_CONSTANTS(X)                                     \
  /* File Extensions */                                         \
  X(MP3_FILE_EXT, ".mp3")                                       \
  X(WAV_FILE_EXT, ".wav")                                       \
  X(WEBM_FILE_EXT, ".webm")                                     \
  X(M4A_FILE_EXT, ".m4a")                                       \
  X(MP4_FILE_EXT, ".mp4")                                       \
  X(OGG_FILE_EXT, ".ogg")                                       \
  X(FLAC_FILE_EXT, ".flac")                                     \
  X(TEMP_PROBE_EXT, ".probe")                                   \
                                                                \
  /* Content Types */                                           \
  X(CONTENT_TYPE_OCTET_STREAM, "application/octet-stream")      \
                                                                \
  /* Temporary Storage */                                       \
  X(TEMP_STORAGE_DIR, "/tmp/warden_temp")                       \
  X(TEMP_FILE_PREFIX, "warden_audio_")                          \
  X(TEMP_PROBE_PREFIX, "warden_probe_")                         \
                                                                \
  /* Transcriber */                                             \
  X(TRANSCRIBER_INPUT_PLACEHOLDER, "{input}")                   \
                                                                \
  /* Environment */                                             \
  X(ENV_LOG_LEVEL, "WARDEN_LOG_LEVEL")                          \
  X(ENV_LOG_DIR, "WARDEN_LOG_DIR")                              \
  X(ENV_MAX_UPLOAD_SIZE, "WARDEN_MAX_UPLOAD_SIZE")              \
  X(ENV_TEMP_DIR, "WARDEN_TEMP_DIR")                            \
                                                                \
  /* Configuration */                                           \
  X(DEFAULT_CONFIG_FILE, "warden.toml")

// Generic client-facing messages. These are the ONLY strings an upload rejection may surface,
// so nothing in here can ever be built out of request data.
#define CLIENT_MESSAGES(X)                                                \
  X(CLIENT_MSG_FILENAME, "Invalid filename provided")                    \
  X(CLIENT_MSG_VALIDATION, "Invalid file format or content")             \
  X(CLIENT_MSG_FILE_SIZE, "File size exceeds maximum allowed size")      \
  X(CLIENT_MSG_PROCESSING, "Audio processing failed")                    \
  X(CLIENT_MSG_SERVER_ERROR, "Internal server error occurred")           \
  X(CLIENT_MSG_FALLBACK, "An error occurred while processing your request")

namespace macros
{

#define DECLARE_STRING_VIEW(name, value) constexpr std::string_view name = value;
STRING_CONSTANTS(DECLARE_STRING_VIEW)
CLIENT_MESSAGES(DECLARE_STRING_VIEW)
#undef DECLARE_STRING_VIEW

// Convert string_view to string using a function (avoiding constexpr std::string)
inline auto to_string(std::string_view sv) -> std::string { return std::string(sv); }

} // namespace macros
