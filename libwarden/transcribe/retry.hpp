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
#include <functional>
#include <random>

#include <libwarden/config/entry.hpp>
#include <libwarden/transcribe/entry.hpp>

namespace libwarden::transcribe
{

struct RetryPolicy
{
  int                       max_attempts = 3;
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{8000};
  double                    multiplier = 2.0;
  double                    jitter     = 0.2; // +- fraction of the computed delay

  std::function<bool(const TranscriptionError&)> retryable = [](const TranscriptionError& e)
  { return e.retryable(); };

  static auto from_config(const config::RetryConfig& cfg) -> RetryPolicy;

  // Delay before attempt `attempt + 1` (attempt is 1 based). `u` in [-1, 1] picks the jitter.
  [[nodiscard]] auto backoff_for(int attempt, double u = 0.0) const -> std::chrono::milliseconds;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Decorates another transcriber with RetryPolicy. The last error is rethrown as is.
class RetryingTranscriber : public Transcriber
{
public:
  RetryingTranscriber(Transcriber& inner, RetryPolicy policy, Sleeper sleeper = {});

  auto transcribe(const std::filesystem::path& audio) -> Transcript override;

  [[nodiscard]] auto attempts() const noexcept -> int { return m_attempts; }

private:
  Transcriber&                           m_inner;
  RetryPolicy                            m_policy;
  Sleeper                                m_sleeper;
  std::mt19937                           m_rng;
  std::uniform_real_distribution<double> m_jitter{-1.0, 1.0};
  int                                    m_attempts = 0;
};

} // namespace libwarden::transcribe
