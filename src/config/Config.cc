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

#include <cerrno>
#include <cstdlib>
#include <libwarden/config/entry.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/utils/math/entry.hpp>
#include <libwarden/utils/string/entry.hpp>
#include <toml++/toml.hpp>

namespace libwarden::config
{

namespace
{

template <typename Int> auto positive_or_throw(std::int64_t value, std::string_view key) -> Int
{
  if (value <= 0)
    throw ConfigError(std::string(key) + " must be positive");
  return static_cast<Int>(value);
}

auto action_or_throw(std::string_view text, std::string_view key) -> ingest::HeuristicAction
{
  const auto action = ingest::parse_heuristic_action(text);
  if (!action)
    throw ConfigError(std::string(key) + " must be one of ignore|warn|reject, got '" +
                      utils::log_safe(text) + "'");
  return *action;
}

void read_ingest(const toml::table& root, IngestConfig& cfg)
{
  namespace K = TomlKeys::Ingest;

  const auto section = root[K::Root];
  if (!section)
    return;

  if (const auto* exts = section[K::AllowedExtensions].as_array())
  {
    ingest::ExtensionSet allowed;
    for (const auto& node : *exts)
    {
      const auto ext = node.value<std::string>();
      if (!ext)
        throw ConfigError(std::string(K::AllowedExtensions) + " must be an array of strings");
      allowed.insert(utils::to_lower_ascii(*ext));
    }
    cfg.allowed_extensions = std::move(allowed);
  }

  if (const auto v = section[K::MaxFilenameLength].value<std::int64_t>())
    cfg.max_filename_length = positive_or_throw<std::size_t>(*v, K::MaxFilenameLength);
  if (const auto v = section[K::MaxUploadSize].value<std::int64_t>())
    cfg.max_upload_size = positive_or_throw<ByteCount>(*v, K::MaxUploadSize);
  if (const auto v = section[K::MinPayloadSize].value<std::int64_t>())
    cfg.min_payload_size = positive_or_throw<std::size_t>(*v, K::MinPayloadSize);

  cfg.enforce_claimed_mime = section[K::EnforceClaimedMime].value_or(cfg.enforce_claimed_mime);
}

void read_heuristics(const toml::table& root, HeuristicConfig& cfg)
{
  namespace K = TomlKeys::Heuristics;

  const auto section = root[K::Root];
  if (!section)
    return;

  cfg.enabled = section[K::Enabled].value_or(cfg.enabled);

  if (const auto v = section[K::ScanWindow].value<std::int64_t>())
    cfg.scan.window = positive_or_throw<std::size_t>(*v, K::ScanWindow);
  if (const auto v = section[K::MaxLineLength].value<std::int64_t>())
    cfg.scan.max_line_length = positive_or_throw<std::size_t>(*v, K::MaxLineLength);

  cfg.scan.null_ratio_threshold =
    section[K::NullRatioThreshold].value_or(cfg.scan.null_ratio_threshold);

  if (const auto v = section[K::SignatureAction].value<std::string>())
    cfg.signature_action = action_or_throw(*v, K::SignatureAction);
  if (const auto v = section[K::AnomalyAction].value<std::string>())
    cfg.anomaly_action = action_or_throw(*v, K::AnomalyAction);
}

void read_temp(const toml::table& root, TempConfig& cfg)
{
  namespace K = TomlKeys::Temp;

  cfg.directory = root[K::Root][K::Directory].value_or(cfg.directory);
  cfg.prefix    = root[K::Root][K::Prefix].value_or(cfg.prefix);
}

void read_transcriber(const toml::table& root, TranscriberConfig& cfg)
{
  namespace K = TomlKeys::Transcriber;

  const auto* argv = root[K::Root][K::Command].as_array();
  if (!argv)
    return;

  cfg.command.clear();
  for (const auto& node : *argv)
  {
    const auto arg = node.value<std::string>();
    if (!arg)
      throw ConfigError(std::string(K::Command) + " must be an array of strings");
    cfg.command.push_back(*arg);
  }
}

void read_retry(const toml::table& root, RetryConfig& cfg)
{
  namespace K = TomlKeys::Retry;

  const auto section = root[K::Root];
  if (!section)
    return;

  if (const auto v = section[K::MaxAttempts].value<std::int64_t>())
    cfg.max_attempts = positive_or_throw<int>(*v, K::MaxAttempts);
  if (const auto v = section[K::InitialBackoffMs].value<std::int64_t>())
    cfg.initial_backoff =
      std::chrono::milliseconds(positive_or_throw<std::int64_t>(*v, K::InitialBackoffMs));
  if (const auto v = section[K::MaxBackoffMs].value<std::int64_t>())
    cfg.max_backoff =
      std::chrono::milliseconds(positive_or_throw<std::int64_t>(*v, K::MaxBackoffMs));

  cfg.multiplier = section[K::Multiplier].value_or(cfg.multiplier);
  cfg.jitter     = section[K::Jitter].value_or(cfg.jitter);
}

auto from_table(const toml::table& root) -> IngestConfig
{
  IngestConfig cfg = default_config();

  read_ingest(root, cfg);
  read_heuristics(root, cfg.heuristics);
  read_temp(root, cfg.temp);
  read_transcriber(root, cfg.transcriber);
  read_retry(root, cfg.retry);

  validate_config(cfg);
  return cfg;
}

} // namespace

auto default_config() -> IngestConfig { return IngestConfig{}; }

auto parse_config(std::string_view toml_text) -> IngestConfig
{
  try
  {
    return from_table(toml::parse(toml_text));
  }
  catch (const toml::parse_error& e)
  {
    throw ConfigError(std::string("malformed TOML: ") + std::string(e.description()));
  }
}

auto load_config_file(const AbsPath& path) -> IngestConfig
{
  try
  {
    auto cfg = from_table(toml::parse_file(path));
    log::INFO<log::CONFIG>("Loaded configuration from %1%", path);
    return cfg;
  }
  catch (const toml::parse_error& e)
  {
    throw ConfigError("cannot load " + path + ": " + std::string(e.description()));
  }
}

void apply_env_overrides(IngestConfig& cfg)
{
  if (const char* size = std::getenv(macros::ENV_MAX_UPLOAD_SIZE.data()))
  {
    errno           = 0;
    char*      end  = nullptr;
    const auto read = std::strtoull(size, &end, 10);

    if (errno != 0 || end == size || *end != '\0' || read == 0)
      throw ConfigError(std::string(macros::ENV_MAX_UPLOAD_SIZE) + " must be a positive integer");

    cfg.max_upload_size = static_cast<ByteCount>(read);
    log::INFO<log::CONFIG>("%1% overrides max upload size: %2%", macros::ENV_MAX_UPLOAD_SIZE,
                           utils::math::bytesFormat(cfg.max_upload_size));
  }

  if (const char* dir = std::getenv(macros::ENV_TEMP_DIR.data()))
  {
    if (*dir == '\0')
      throw ConfigError(std::string(macros::ENV_TEMP_DIR) + " must not be empty");

    cfg.temp.directory = dir;
    log::INFO<log::CONFIG>("%1% overrides temp directory: %2%", macros::ENV_TEMP_DIR,
                           cfg.temp.directory);
  }

  validate_config(cfg);
}

void validate_config(const IngestConfig& cfg)
{
  if (cfg.allowed_extensions.empty())
    throw ConfigError("allowed_extensions must not be empty");

  for (const auto& ext : cfg.allowed_extensions)
  {
    if (ext.size() < 2 || ext.front() != '.')
      throw ConfigError("allowed extension '" + utils::log_safe(ext) + "' must start with '.'");
    if (ext != utils::to_lower_ascii(ext))
      throw ConfigError("allowed extension '" + utils::log_safe(ext) + "' must be lower-case");
  }

  if (cfg.max_filename_length == 0 || cfg.max_upload_size == 0 || cfg.min_payload_size == 0)
    throw ConfigError("size limits must be positive");

  if (cfg.min_payload_size > cfg.max_upload_size)
    throw ConfigError("min_payload_size exceeds max_upload_size");

  if (cfg.heuristics.scan.window == 0 || cfg.heuristics.scan.max_line_length == 0)
    throw ConfigError("heuristic limits must be positive");

  if (!(cfg.heuristics.scan.null_ratio_threshold > 0.0 &&
        cfg.heuristics.scan.null_ratio_threshold <= 1.0))
    throw ConfigError("null_ratio_threshold must be in (0, 1]");

  if (cfg.temp.directory.empty())
    throw ConfigError("temp directory must not be empty");

  if (cfg.temp.prefix.find('/') != std::string::npos)
    throw ConfigError("temp prefix must not contain '/'");

  if (cfg.retry.max_attempts < 1)
    throw ConfigError("retry.max_attempts must be at least 1");

  if (cfg.retry.initial_backoff > cfg.retry.max_backoff)
    throw ConfigError("retry.initial_backoff_ms exceeds retry.max_backoff_ms");

  if (cfg.retry.multiplier < 1.0)
    throw ConfigError("retry.multiplier must be >= 1.0");

  if (cfg.retry.jitter < 0.0 || cfg.retry.jitter > 1.0)
    throw ConfigError("retry.jitter must be in [0, 1]");
}

} // namespace libwarden::config
