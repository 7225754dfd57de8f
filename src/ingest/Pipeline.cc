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

#include <libwarden/ingest/mime.hpp>
#include <libwarden/ingest/pipeline.hpp>
#include <libwarden/log-macros.hpp>
#include <libwarden/utils/digest/entry.hpp>
#include <libwarden/utils/math/entry.hpp>
#include <libwarden/utils/string/entry.hpp>

namespace libwarden::ingest
{

IngestPipeline::IngestPipeline(config::IngestConfig cfg, metrics::IngestMetrics* metrics)
    : m_config(std::move(cfg)), m_metrics(metrics)
{
  config::validate_config(m_config);
}

auto IngestPipeline::note(const Rejection& rejection) const -> Rejection
{
  log::WARN<log::PIPELINE>("Upload rejected: %1% (%2%)", rejection.kind, rejection.detail);
  if (m_metrics)
    m_metrics->record_rejection(rejection.kind);
  return rejection;
}

auto IngestPipeline::check_size(ByteCount size) const -> Verdict<ByteCount>
{
  if (size > m_config.max_upload_size)
  {
    log::WARN<log::PIPELINE>("Upload of %1% exceeds the %2% limit", utils::math::bytesFormat(size),
                             utils::math::bytesFormat(m_config.max_upload_size));
    return reject(RejectKind::SizeExceeded, "payload larger than max_upload_size");
  }
  return size;
}

auto IngestPipeline::apply_heuristics(const SanitizedFilename& name, ByteView payload,
                                      std::vector<Finding>& warnings) const -> bool
{
  const auto& policy = m_config.heuristics;
  const auto  report = scan(payload, policy.scan);

  bool reject_upload = false;

  for (const auto& finding : report.findings)
  {
    const auto action = finding.category == FindingCategory::Signature ? policy.signature_action
                                                                       : policy.anomaly_action;
    switch (action)
    {
      case HeuristicAction::Reject:
        log::WARN<log::SCANNER>("'%1%': %2% at offset %3% rejects the upload", name, finding.kind,
                                finding.offset);
        reject_upload = true;
        break;

      case HeuristicAction::Warn:
        log::WARN<log::SCANNER>("'%1%': %2% at offset %3% (warning only)", name, finding.kind,
                                finding.offset);
        warnings.push_back(finding);
        if (m_metrics)
          m_metrics->heuristic_warnings.fetch_add(1, std::memory_order_relaxed);
        break;

      case HeuristicAction::Ignore:
        log::DBG<log::SCANNER>("'%1%': ignoring %2% at offset %3%", name, finding.kind,
                               finding.offset);
        break;
    }
  }

  return !reject_upload;
}

auto IngestPipeline::validate(const UploadCandidate& candidate) const -> Verdict<ValidatedUpload>
{
  if (m_metrics)
    m_metrics->total_uploads.fetch_add(1, std::memory_order_relaxed);

  log::DBG<log::PIPELINE>("Validating upload '%1%' (%2% bytes, claimed type '%3%')",
                          utils::log_safe(candidate.filename), candidate.payload.size(),
                          utils::log_safe(candidate.claimed_mime));

  auto name = sanitize_filename(candidate.filename, m_config.max_filename_length);
  if (!name)
    return note(name.rejection());

  auto ext = validate_extension(name.value(), m_config.allowed_extensions);
  if (!ext)
    return note(ext.rejection());

  if (const auto size = check_size(candidate.payload.size()); !size)
    return note(size.rejection());

  const ByteView payload{candidate.payload};

  const auto format = validate_signature(payload, ext.value(), m_config.min_payload_size);
  if (!format)
    return note(format.rejection());

  switch (check_claimed_mime(candidate.claimed_mime, format.value()))
  {
    case MimeAgreement::NoClaim:
    case MimeAgreement::Match:
      break;

    case MimeAgreement::Mismatch:
      if (m_metrics)
        m_metrics->mime_mismatches.fetch_add(1, std::memory_order_relaxed);
      log::WARN<log::PIPELINE>("'%1%' claims '%2%' but contains %3%", name.value(),
                               utils::log_safe(parse_base_mime(candidate.claimed_mime)),
                               format.value());
      if (m_config.enforce_claimed_mime)
        return note(reject(RejectKind::ContentMismatch, "claimed MIME type disagrees"));
      break;
  }

  std::vector<Finding> warnings;
  if (m_config.heuristics.enabled && !apply_heuristics(name.value(), payload, warnings))
    return note(reject(RejectKind::SuspiciousContent, "heuristic scanner finding"));

  auto digest = utils::digest::compute_sha256_hex(payload);
  if (!digest)
    log::ERROR<log::PIPELINE>("SHA-256 unavailable for '%1%'", name.value());

  log::INFO<log::PIPELINE>("Accepted '%1%' as %2% (%3%, sha256 %4%)", name.value(),
                           format.value(), utils::math::bytesFormat(payload.size()),
                           digest.value_or("unavailable"));

  if (m_metrics)
    m_metrics->record_acceptance(payload.size());

  return ValidatedUpload{
    .name      = std::move(name).value(),
    .extension = std::move(ext).value(),
    .format    = format.value(),
    .payload   = payload,
    .sha256    = digest.value_or(""),
    .warnings  = std::move(warnings),
  };
}

auto IngestPipeline::stage(const ValidatedUpload& upload) const -> Verdict<SecureTempFile>
{
  try
  {
    return SecureTempFile::create(m_config.temp.directory, m_config.temp.prefix,
                                  upload.extension.str(), upload.payload);
  }
  catch (const TempFileError& e)
  {
    return note(reject(RejectKind::TempFileAllocationFailure, e.what()));
  }
}

auto IngestPipeline::process(const UploadCandidate&  candidate,
                             transcribe::Transcriber& transcriber) const -> Verdict<Transcript>
{
  auto validated = validate(candidate);
  if (!validated)
    return validated.rejection();

  auto staged = stage(validated.value());
  if (!staged)
    return staged.rejection();

  // Owns the file from here on, every return below (and any throw) removes it
  SecureTempFile audio = std::move(staged).value();

  try
  {
    Transcript transcript = transcriber.transcribe(audio.path());
    if (m_metrics)
      m_metrics->transcriptions_succeeded.fetch_add(1, std::memory_order_relaxed);

    log::INFO<log::PIPELINE>("'%1%' transcribed", validated.value().name);
    return transcript;
  }
  catch (const transcribe::TranscriptionError& e)
  {
    if (m_metrics)
      m_metrics->transcriptions_failed.fetch_add(1, std::memory_order_relaxed);
    return note(reject(RejectKind::DownstreamProcessingFailure,
                       std::string("transcriber status ") + std::to_string(e.status()) + ": " +
                         e.what()));
  }
  catch (const std::exception& e)
  {
    if (m_metrics)
      m_metrics->transcriptions_failed.fetch_add(1, std::memory_order_relaxed);
    return note(reject(RejectKind::DownstreamProcessingFailure, e.what()));
  }
}

} // namespace libwarden::ingest
