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

#include <libwarden/metrics/entry.hpp>
#include <sstream>

namespace libwarden::metrics
{

void IngestMetrics::record_rejection(ingest::RejectKind kind)
{
  rejected_uploads.fetch_add(1, std::memory_order_relaxed);
  rejections[static_cast<std::size_t>(kind)].fetch_add(1, std::memory_order_relaxed);
}

void IngestMetrics::record_acceptance(ByteCount bytes)
{
  accepted_uploads.fetch_add(1, std::memory_order_relaxed);
  accepted_bytes.fetch_add(bytes, std::memory_order_relaxed);
}

auto IngestMetrics::rejections_of(ingest::RejectKind kind) const -> ui64
{
  return rejections[static_cast<std::size_t>(kind)].load(std::memory_order_relaxed);
}

auto IngestMetrics::get_uptime() const -> std::chrono::seconds
{
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() -
                                                          start_time);
}

auto MetricsSerializer::to_prometheus_format(const IngestMetrics& m) -> std::string
{
  std::ostringstream out;

  // Helper lambda to reduce duplication
  auto metric = [&](const std::string& name, const std::string& type, const std::string& help,
                    const auto& value)
  {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " " << type << "\n";
    out << name << " " << value << "\n\n";
  };

  metric("warden_uploads_total", "counter", "Total uploads seen by the ingest pipeline",
         m.total_uploads.load());
  metric("warden_uploads_accepted_total", "counter", "Uploads that passed every check",
         m.accepted_uploads.load());
  metric("warden_uploads_rejected_total", "counter", "Uploads rejected for any reason",
         m.rejected_uploads.load());
  metric("warden_accepted_bytes_total", "counter", "Bytes of accepted uploads",
         m.accepted_bytes.load());
  metric("warden_heuristic_warnings_total", "counter",
         "Heuristic findings that were logged but not rejected", m.heuristic_warnings.load());
  metric("warden_mime_mismatches_total", "counter",
         "Claimed content types that disagreed with the detected format",
         m.mime_mismatches.load());
  metric("warden_transcriptions_succeeded_total", "counter", "Successful transcriptions",
         m.transcriptions_succeeded.load());
  metric("warden_transcriptions_failed_total", "counter", "Failed transcriptions",
         m.transcriptions_failed.load());

  const std::string name = "warden_rejections_total";
  out << "# HELP " << name << " Rejections by kind\n";
  out << "# TYPE " << name << " counter\n";
  for (std::size_t i = 0; i < ingest::kRejectKindCount; ++i)
  {
    out << name << "{kind=\"" << ingest::to_string(static_cast<ingest::RejectKind>(i)) << "\"} "
        << m.rejections[i].load() << "\n";
  }
  out << "\n";

  metric("warden_uptime_seconds", "gauge", "Process uptime in seconds", m.get_uptime().count());

  return out.str();
}

} // namespace libwarden::metrics
