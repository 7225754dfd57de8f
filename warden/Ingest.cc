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

#if __cplusplus < 202002L
#error "warden-ingest requires C++20 or later."
#endif

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <libwarden/common/macros.hpp>
#include <libwarden/config/entry.hpp>
#include <libwarden/health/entry.hpp>
#include <libwarden/ingest/messages.hpp>
#include <libwarden/ingest/pipeline.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/metrics/entry.hpp>
#include <libwarden/transcribe/command.hpp>
#include <libwarden/transcribe/retry.hpp>
#include <libwarden/utils/cmd-line/parser.hpp>
#include <libwarden/utils/string/entry.hpp>

namespace fs = std::filesystem;

using namespace libwarden;

namespace
{

auto load_configuration(const utils::cmdline::CmdLineParser& parser) -> config::IngestConfig
{
  config::IngestConfig cfg;

  if (const auto path = parser.get<std::string>("config"))
  {
    cfg = config::load_config_file(*path);
  }
  else if (fs::exists(macros::DEFAULT_CONFIG_FILE))
  {
    cfg = config::load_config_file(macros::to_string(macros::DEFAULT_CONFIG_FILE));
  }
  else
  {
    log::INFO<log::CONFIG>("No %1% found, running with built-in defaults",
                           macros::DEFAULT_CONFIG_FILE);
    cfg = config::default_config();
  }

  config::apply_env_overrides(cfg);
  return cfg;
}

auto print_health(const config::IngestConfig& cfg) -> bool
{
  const auto status = health::HealthChecker::check_ingest_health(cfg);

  std::cout << "status: " << status.status_message << "\n";
  for (const auto& [check, result] : status.checks)
    std::cout << "  " << check << ": " << result << "\n";

  return status.is_healthy;
}

auto read_payload(const fs::path& file, ByteCount size) -> ByteBuffer
{
  std::ifstream in(file, std::ios::binary);
  if (!in)
    throw std::runtime_error("Unable to open file: " + file.string());

  ByteBuffer payload(size);
  in.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(size));
  if (static_cast<ByteCount>(in.gcount()) != size)
    throw std::runtime_error("Short read on file: " + file.string());

  return payload;
}

auto report_rejection(const ingest::Rejection& rejection) -> int
{
  const auto error = ingest::make_client_error(rejection);
  std::cout << "rejected " << error.status << " " << error.message << "\n";
  return WARDEN_RET_FAIL;
}

auto run(const utils::cmdline::CmdLineParser& parser) -> int
{
  const auto cfg = load_configuration(parser);

  metrics::IngestMetrics ingest_metrics;
  ingest::IngestPipeline pipeline(cfg, &ingest_metrics);

  const bool want_health  = parser.has("health");
  const bool want_metrics = parser.has("metrics");
  const bool want_text    = parser.has("transcribe");
  const auto file         = parser.get<std::string>("file");
  const auto name         = parser.get<std::string>("name");
  const auto mime         = parser.get_or<std::string>("mime", "");

  int rc = WARDEN_RET_SUC;

  if (want_health && !print_health(cfg))
    rc = WARDEN_RET_FAIL;

  if (file)
  {
    if (want_text && cfg.transcriber.command.empty())
    {
      log::ERROR<log::CLI>("--transcribe needs [transcriber].command in the configuration");
      return WARDEN_RET_USAGE;
    }

    std::error_code ec;
    const auto      size = fs::file_size(*file, ec);
    if (ec)
    {
      log::ERROR<log::CLI>("Cannot stat %1%: %2%", utils::log_safe(*file), ec.message());
      return WARDEN_RET_USAGE;
    }

    // Refuse oversized uploads before a single byte of them is read
    if (const auto admitted = pipeline.check_size(size); !admitted)
    {
      ingest_metrics.total_uploads.fetch_add(1);
      ingest_metrics.record_rejection(admitted.kind());
      rc = report_rejection(admitted.rejection());
    }
    else
    {
      ingest::UploadCandidate candidate{
        .filename     = name.value_or(fs::path(*file).filename().string()),
        .payload      = read_payload(*file, size),
        .claimed_mime = mime,
      };

      if (want_text)
      {
        transcribe::CommandTranscriber command(cfg.transcriber.command);
        transcribe::RetryingTranscriber retrying(command,
                                                 transcribe::RetryPolicy::from_config(cfg.retry));

        const auto transcript = pipeline.process(candidate, retrying);
        if (!transcript)
          rc = report_rejection(transcript.rejection());
        else
          std::cout << transcript.value() << "\n";
      }
      else
      {
        const auto validated = pipeline.validate(candidate);
        if (!validated)
        {
          rc = report_rejection(validated.rejection());
        }
        else
        {
          const auto& upload = validated.value();
          std::cout << "accepted " << upload.name << " " << upload.format << " "
                    << upload.payload.size() << " " << upload.sha256 << "\n";
          for (const auto& warning : upload.warnings)
            std::cout << "  warning " << warning.kind << " @" << warning.offset << "\n";
        }
      }
    }
  }
  else if (!want_health && !want_metrics)
  {
    parser.print_usage();
    return WARDEN_RET_USAGE;
  }

  if (want_metrics)
    std::cout << metrics::MetricsSerializer::to_prometheus_format(ingest_metrics);

  return rc;
}

} // namespace

auto main(int argc, char* argv[]) -> int
{
  INIT_WARDEN_LOGGER();

  try
  {
    utils::cmdline::CmdLineParser parser({argv, static_cast<std::size_t>(argc)});

    using utils::cmdline::ArgKind;
    parser.register_args({
      {"file", ArgKind::Value, "<path>",
       "Audio file to ingest, treated exactly like an untrusted upload"},
      {"name", ArgKind::Value, "<filename>",
       "Upload filename to present instead of the file's own name"},
      {"mime", ArgKind::Value, "<type>", "Claimed Content-Type of the upload"},
      {"config", ArgKind::Value, "<path>",
       "Path to a warden.toml (default: ./warden.toml when present)"},
      {"transcribe", ArgKind::Flag, "",
       "Hand accepted uploads to [transcriber].command and print the text"},
      {"health", ArgKind::Flag, "", "Print the ingest health report"},
      {"metrics", ArgKind::Flag, "", "Print metrics in Prometheus text format when done"},
      {"help", ArgKind::Flag, "", "Show this message (-h)"},
    });

    if (parser.has("help"))
    {
      parser.print_usage(std::cout);
      return WARDEN_RET_SUC;
    }

    return run(parser);
  }
  catch (const std::invalid_argument& e)
  {
    log::ERROR<log::CLI>("%1%", utils::log_safe(e.what()));
    return WARDEN_RET_USAGE;
  }
  catch (const config::ConfigError& e)
  {
    log::ERROR<log::CONFIG>("Configuration rejected: %1%", e.what());
    return WARDEN_RET_USAGE;
  }
  catch (const std::exception& e)
  {
    log::ERROR<log::CLI>("warden-ingest failed: %1%", e.what());
    return WARDEN_RET_FAIL;
  }
}
