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

#include <vector>

#include <libwarden/common/types.hpp>
#include <libwarden/config/entry.hpp>
#include <libwarden/ingest/extension.hpp>
#include <libwarden/ingest/sanitizer.hpp>
#include <libwarden/ingest/scanner.hpp>
#include <libwarden/ingest/signature.hpp>
#include <libwarden/ingest/tempfile.hpp>
#include <libwarden/ingest/verdict.hpp>
#include <libwarden/metrics/entry.hpp>
#include <libwarden/transcribe/entry.hpp>

/*
 * INGEST PIPELINE
 *
 *   UploadCandidate
 *     -> sanitize_filename      (PathTraversal)
 *     -> validate_extension     (MissingExtension, UnsupportedExtension)
 *     -> size limit             (SizeExceeded)
 *     -> validate_signature     (ContentMismatch, UnrecognizedContent)
 *     -> claimed MIME check     (warning, ContentMismatch when enforced)
 *     -> heuristic scan         (SuspiciousContent, per HeuristicAction)
 *     -> ValidatedUpload
 *     -> SecureTempFile         (TempFileAllocationFailure)
 *     -> Transcriber            (DownstreamProcessingFailure)
 *
 * The first failing stage wins, nothing after it runs. Every exit path of process() removes the
 * staged file because SecureTempFile owns it.
 *
 */

namespace libwarden::ingest
{

// One upload as it came off the wire. Every field is attacker controlled.
struct UploadCandidate
{
  RawFileName filename;
  ByteBuffer  payload;
  MimeType    claimed_mime;
};

// `payload` views into the UploadCandidate it came from, keep that candidate alive
struct ValidatedUpload
{
  SanitizedFilename    name;
  ExtensionToken       extension;
  AudioFormat          format;
  ByteView             payload;
  HexDigest            sha256;
  std::vector<Finding> warnings;
};

class IngestPipeline
{
public:
  explicit IngestPipeline(config::IngestConfig cfg, metrics::IngestMetrics* metrics = nullptr);

  [[nodiscard]] auto check_size(ByteCount size) const -> Verdict<ByteCount>;

  [[nodiscard]] auto validate(const UploadCandidate& candidate) const -> Verdict<ValidatedUpload>;

  [[nodiscard]] auto stage(const ValidatedUpload& upload) const -> Verdict<SecureTempFile>;

  // validate -> stage -> transcribe. The staged file is gone when this returns (or throws).
  [[nodiscard]] auto process(const UploadCandidate&  candidate,
                             transcribe::Transcriber& transcriber) const -> Verdict<Transcript>;

  [[nodiscard]] auto config() const noexcept -> const config::IngestConfig& { return m_config; }

private:
  [[nodiscard]] auto apply_heuristics(const SanitizedFilename& name, ByteView payload,
                                      std::vector<Finding>& warnings) const -> bool;

  auto note(const Rejection& rejection) const -> Rejection;

  config::IngestConfig    m_config;
  metrics::IngestMetrics* m_metrics;
};

} // namespace libwarden::ingest
