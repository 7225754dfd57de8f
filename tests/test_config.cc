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

#include <libwarden/config/entry.hpp>

#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

#include "helpers.hpp"

using namespace libwarden;
using config::ConfigError;
using ingest::HeuristicAction;

namespace
{

// Sets an environment variable for the lifetime of the guard
class EnvGuard
{
public:
  EnvGuard(const char* name, const char* value) : m_name(name) { ::setenv(name, value, 1); }
  ~EnvGuard() { ::unsetenv(m_name); }

  EnvGuard(const EnvGuard&)                    = delete;
  auto operator=(const EnvGuard&) -> EnvGuard& = delete;

private:
  const char* m_name;
};

constexpr auto FULL_CONFIG = R"(
[ingest]
allowed_extensions   = [".mp3", ".WAV"]
max_filename_length  = 128
max_upload_size      = 1048576
min_payload_size     = 32
enforce_claimed_mime = true

[heuristics]
enabled              = false
scan_window          = 4096
null_ratio_threshold = 0.75
max_line_length      = 2000
signature_action     = "warn"
anomaly_action       = "ignore"

[temp]
directory = "/var/tmp/warden"
prefix    = "upload_"

[transcriber]
command = ["whisper-cli", "-nt", "-f", "{input}"]

[retry]
max_attempts       = 5
initial_backoff_ms = 250
max_backoff_ms     = 4000
multiplier         = 3
jitter             = 0.1
)";

} // namespace

TEST(ConfigTest, DefaultsMatchTheDocumentedLimits)
{
  const auto cfg = config::default_config();

  EXPECT_EQ(cfg.allowed_extensions, ingest::default_extension_set());
  EXPECT_EQ(cfg.max_filename_length, 255u);
  EXPECT_EQ(cfg.max_upload_size, 26214400u);
  EXPECT_EQ(cfg.min_payload_size, 20u);
  EXPECT_FALSE(cfg.enforce_claimed_mime);

  EXPECT_TRUE(cfg.heuristics.enabled);
  EXPECT_EQ(cfg.heuristics.scan.window, 1024u);
  EXPECT_DOUBLE_EQ(cfg.heuristics.scan.null_ratio_threshold, 0.5);
  EXPECT_EQ(cfg.heuristics.scan.max_line_length, 800u);
  EXPECT_EQ(cfg.heuristics.signature_action, HeuristicAction::Reject);
  EXPECT_EQ(cfg.heuristics.anomaly_action, HeuristicAction::Warn);

  EXPECT_EQ(cfg.temp.directory, "/tmp/warden_temp");
  EXPECT_EQ(cfg.temp.prefix, "warden_audio_");
  EXPECT_TRUE(cfg.transcriber.command.empty());

  EXPECT_EQ(cfg.retry.max_attempts, 3);
  EXPECT_EQ(cfg.retry.initial_backoff.count(), 500);
  EXPECT_EQ(cfg.retry.max_backoff.count(), 8000);

  EXPECT_NO_THROW(config::validate_config(cfg));
}

TEST(ConfigTest, ParsesEverySection)
{
  const auto cfg = config::parse_config(FULL_CONFIG);

  const ingest::ExtensionSet expected_exts = {".mp3", ".wav"};
  EXPECT_EQ(cfg.allowed_extensions, expected_exts);
  EXPECT_EQ(cfg.max_filename_length, 128u);
  EXPECT_EQ(cfg.max_upload_size, 1048576u);
  EXPECT_EQ(cfg.min_payload_size, 32u);
  EXPECT_TRUE(cfg.enforce_claimed_mime);

  EXPECT_FALSE(cfg.heuristics.enabled);
  EXPECT_EQ(cfg.heuristics.scan.window, 4096u);
  EXPECT_DOUBLE_EQ(cfg.heuristics.scan.null_ratio_threshold, 0.75);
  EXPECT_EQ(cfg.heuristics.scan.max_line_length, 2000u);
  EXPECT_EQ(cfg.heuristics.signature_action, HeuristicAction::Warn);
  EXPECT_EQ(cfg.heuristics.anomaly_action, HeuristicAction::Ignore);

  EXPECT_EQ(cfg.temp.directory, "/var/tmp/warden");
  EXPECT_EQ(cfg.temp.prefix, "upload_");

  const std::vector<std::string> argv = {"whisper-cli", "-nt", "-f", "{input}"};
  EXPECT_EQ(cfg.transcriber.command, argv);

  EXPECT_EQ(cfg.retry.max_attempts, 5);
  EXPECT_EQ(cfg.retry.initial_backoff.count(), 250);
  EXPECT_EQ(cfg.retry.max_backoff.count(), 4000);
  EXPECT_DOUBLE_EQ(cfg.retry.multiplier, 3.0);
  EXPECT_DOUBLE_EQ(cfg.retry.jitter, 0.1);
}

TEST(ConfigTest, MissingKeysKeepDefaults)
{
  const auto cfg = config::parse_config("[ingest]\nmax_upload_size = 4096\n");

  EXPECT_EQ(cfg.max_upload_size, 4096u);
  EXPECT_EQ(cfg.allowed_extensions, ingest::default_extension_set());
  EXPECT_EQ(cfg.heuristics.signature_action, HeuristicAction::Reject);

  EXPECT_NO_THROW(config::parse_config(""));
}

TEST(ConfigTest, RejectsMalformedValues)
{
  EXPECT_THROW(config::parse_config("[ingest\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[heuristics]\nsignature_action = \"block\"\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[heuristics]\nnull_ratio_threshold = 1.5\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[heuristics]\nnull_ratio_threshold = 0.0\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[ingest]\nmax_upload_size = -1\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[ingest]\nallowed_extensions = [\"mp3\"]\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[ingest]\nallowed_extensions = [1, 2]\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[ingest]\nallowed_extensions = []\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[transcriber]\ncommand = [\"a\", 2]\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[retry]\nmax_attempts = 0\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[retry]\ninitial_backoff_ms = 9000\n"), ConfigError);
  EXPECT_THROW(config::parse_config("[temp]\nprefix = \"../x\"\n"), ConfigError);
}

TEST(ConfigTest, LoadsFromFile)
{
  warden_test::ScopedTempDir dir;
  const auto                 path = dir.path() / "warden.toml";
  std::ofstream(path) << FULL_CONFIG;

  const auto cfg = config::load_config_file(path.string());
  EXPECT_EQ(cfg.temp.prefix, "upload_");

  EXPECT_THROW(config::load_config_file((dir.path() / "missing.toml").string()), ConfigError);
}

TEST(ConfigTest, EnvironmentOverridesFileValues)
{
  auto cfg = config::parse_config(FULL_CONFIG);

  {
    EnvGuard size("WARDEN_MAX_UPLOAD_SIZE", "2048");
    EnvGuard dir("WARDEN_TEMP_DIR", "/srv/warden/tmp");
    config::apply_env_overrides(cfg);
  }

  EXPECT_EQ(cfg.max_upload_size, 2048u);
  EXPECT_EQ(cfg.temp.directory, "/srv/warden/tmp");
}

TEST(ConfigTest, RejectsMalformedEnvironment)
{
  auto cfg = config::default_config();

  {
    EnvGuard size("WARDEN_MAX_UPLOAD_SIZE", "25MB");
    EXPECT_THROW(config::apply_env_overrides(cfg), ConfigError);
  }
  {
    EnvGuard size("WARDEN_MAX_UPLOAD_SIZE", "0");
    EXPECT_THROW(config::apply_env_overrides(cfg), ConfigError);
  }
  {
    EnvGuard dir("WARDEN_TEMP_DIR", "");
    EXPECT_THROW(config::apply_env_overrides(cfg), ConfigError);
  }

  EXPECT_EQ(cfg.max_upload_size, 26214400u);
}
