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

#include <map>
#include <string>

#include <libwarden/config/entry.hpp>

namespace libwarden::health
{

class HealthChecker
{
public:
  struct HealthStatus
  {
    bool                               is_healthy     = true;
    std::string                        status_message = "OK";
    std::map<std::string, std::string> checks;
  };

  // Can this process stage an upload right now? Probes the temp directory for real.
  static auto check_ingest_health(const config::IngestConfig& cfg) -> HealthStatus;
};

} // namespace libwarden::health
