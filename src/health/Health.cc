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

#include <array>
#include <filesystem>
#include <libwarden/common/macros.hpp>
#include <libwarden/health/entry.hpp>
#include <libwarden/ingest/tempfile.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/utils/math/entry.hpp>

namespace fs = std::filesystem;

namespace libwarden::health
{

namespace
{

constexpr std::array<ui8, 4> PROBE_BYTES = {'w', 'a', 'r', 'd'};

} // namespace

auto HealthChecker::check_ingest_health(const config::IngestConfig& cfg) -> HealthStatus
{
  HealthStatus status;

  // Temp directory must accept exactly the kind of file an upload becomes
  try
  {
    auto probe = ingest::SecureTempFile::create(cfg.temp.directory, macros::TEMP_PROBE_PREFIX,
                                                macros::TEMP_PROBE_EXT, PROBE_BYTES);
    if (probe.release())
    {
      status.checks["temp_storage"] = "OK";
    }
    else
    {
      status.is_healthy             = false;
      status.checks["temp_storage"] = "FAIL - Probe file could not be removed";
    }
  }
  catch (const ingest::TempFileError& e)
  {
    status.is_healthy             = false;
    status.checks["temp_storage"] = "FAIL - " + std::string(e.what());
  }

  // Disk space: one maximum sized upload must always fit
  std::error_code ec;
  const auto      space = fs::space(cfg.temp.directory, ec);
  if (ec)
  {
    status.is_healthy           = false;
    status.checks["disk_space"] = "UNKNOWN - " + ec.message();
  }
  else if (space.available < cfg.max_upload_size)
  {
    status.is_healthy           = false;
    status.checks["disk_space"] =
      "FAIL - Only " + utils::math::bytesFormat(space.available) + " available";
  }
  else
  {
    status.checks["disk_space"] = "OK - " + utils::math::bytesFormat(space.available) + " free";
  }

  status.checks["transcriber"] = cfg.transcriber.command.empty() ? "NOT CONFIGURED" : "OK";

  // Update overall status message
  if (!status.is_healthy)
  {
    status.status_message = "UNHEALTHY";
    log::WARN<log::HEALTH>("Ingest health check failed");
  }

  return status;
}

} // namespace libwarden::health
