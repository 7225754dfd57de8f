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

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <libwarden/common/api/entry.hpp>
#include <libwarden/common/macros.hpp>
#include <libwarden/common/types.hpp>
#include <libwarden/ingest/extension.hpp>
#include <libwarden/ingest/scanner.hpp>
#include <libwarden/utils/math/entry.hpp>

/*
 * CONFIG
 *
 * Everything the ingest pipeline and its collaborators can be tuned with.
 *
 * Sources, in order of precedence (last wins):
 *
 *   1. default_config()             -> compiled in defaults
 *   2. warden.toml (toml++)         -> [ingest] [heuristics] [temp] [transcriber] [retry]
 *   3. environment                  -> WARDEN_MAX_UPLOAD_SIZE, WARDEN_TEMP_DIR
 *
 * Missing keys keep their default. Malformed values are a ConfigError, never silently ignored.
 *
 */

namespace libwarden::config
{

class ConfigError : public std::runtime_error
{
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

namespace TomlKeys
{
namespace Ingest
{
inline constexpr auto Root               = "ingest";
inline constexpr auto AllowedExtensions  = "allowed_extensions";
inline constexpr auto MaxFilenameLength  = "max_filename_length";
inline constexpr auto MaxUploadSize      = "max_upload_size";
inline constexpr auto MinPayloadSize     = "min_payload_size";
inline constexpr auto EnforceClaimedMime = "enforce_claimed_mime";
} // namespace Ingest

namespace Heuristics
{
inline constexpr auto Root               = "heuristics";
inline constexpr auto Enabled            = "enabled";
inline constexpr auto ScanWindow         = "scan_window";
inline constexpr auto NullRatioThreshold = "null_ratio_threshold";
inline constexpr auto MaxLineLength      = "max_line_length";
inline constexpr auto SignatureAction    = "signature_action";
inline constexpr auto AnomalyAction      = "anomaly_action";
} // namespace Heuristics

namespace Temp
{
inline constexpr auto Root      = "temp";
inline constexpr auto Directory = "directory";
inline constexpr auto Prefix    = "prefix";
} // namespace Temp

namespace Transcriber
{
inline constexpr auto Root    = "transcriber";
inline constexpr auto Command = "command";
} // namespace Transcriber

namespace Retry
{
inline constexpr auto Root             = "retry";
inline constexpr auto MaxAttempts      = "max_attempts";
inline constexpr auto InitialBackoffMs = "initial_backoff_ms";
inline constexpr auto MaxBackoffMs     = "max_backoff_ms";
inline constexpr auto Multiplier       = "multiplier";
inline constexpr auto Jitter           = "jitter";
} // namespace Retry
} // namespace TomlKeys

struct HeuristicConfig
{
  bool                    enabled = true;
  ingest::ScanOptions     scan{};
  ingest::HeuristicAction signature_action = ingest::HeuristicAction::Reject;
  ingest::HeuristicAction anomaly_action   = ingest::HeuristicAction::Warn;
};

struct TempConfig
{
  Directory   directory = macros::to_string(macros::TEMP_STORAGE_DIR);
  std::string prefix    = macros::to_string(macros::TEMP_FILE_PREFIX);
};

struct TranscriberConfig
{
  // argv, no shell involved. "{input}" is replaced by the staged file path.
  std::vector<std::string> command;
};

struct RetryConfig
{
  int                       max_attempts = 3;
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{8000};
  double                    multiplier = 2.0;
  double                    jitter     = 0.2;
};

struct IngestConfig
{
  ingest::ExtensionSet allowed_extensions   = ingest::default_extension_set();
  std::size_t          max_filename_length  = WARDEN_MAX_FILENAME_LENGTH;
  ByteCount            max_upload_size =
    static_cast<ByteCount>(WARDEN_UPLOAD_SIZE_LIMIT) * ONE_MIB;
  std::size_t          min_payload_size     = WARDEN_MIN_PAYLOAD_SIZE;
  bool                 enforce_claimed_mime = false;

  HeuristicConfig   heuristics;
  TempConfig        temp;
  TranscriberConfig transcriber;
  RetryConfig       retry;
};

WARDEN_API auto default_config() -> IngestConfig;

// Both of these validate before returning and throw ConfigError on anything malformed
WARDEN_API auto parse_config(std::string_view toml_text) -> IngestConfig;
WARDEN_API auto load_config_file(const AbsPath& path) -> IngestConfig;

WARDEN_API void apply_env_overrides(IngestConfig& cfg);
WARDEN_API void validate_config(const IngestConfig& cfg);

} // namespace libwarden::config
