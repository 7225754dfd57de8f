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

#include <array>
#include <atomic>
#include <chrono>
#include <string>

#include <libwarden/common/types.hpp>
#include <libwarden/ingest/verdict.hpp>

namespace libwarden::metrics
{

// Shared by every upload running through one IngestPipeline, hence atomics only
struct IngestMetrics
{
  std::atomic<ui64> total_uploads{0};
  std::atomic<ui64> accepted_uploads{0};
  std::atomic<ui64> rejected_uploads{0};
  std::atomic<ui64> accepted_bytes{0};
  std::atomic<ui64> heuristic_warnings{0};
  std::atomic<ui64> mime_mismatches{0};

  std::atomic<ui64> transcriptions_succeeded{0};
  std::atomic<ui64> transcriptions_failed{0};

  // Indexed by RejectKind
  std::array<std::atomic<ui64>, ingest::kRejectKindCount> rejections{};

  // Uptime tracking
  std::chrono::steady_clock::time_point start_time;

  IngestMetrics() : start_time(std::chrono::steady_clock::now()) {}

  void record_rejection(ingest::RejectKind kind);
  void record_acceptance(ByteCount bytes);

  [[nodiscard]] auto rejections_of(ingest::RejectKind kind) const -> ui64;
  [[nodiscard]] auto get_uptime() const -> std::chrono::seconds;
};

class MetricsSerializer
{
public:
  static auto to_prometheus_format(const IngestMetrics& m) -> std::string;
};

} // namespace libwarden::metrics
