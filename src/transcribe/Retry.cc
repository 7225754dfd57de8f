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

#include <algorithm>
#include <cmath>
#include <libwarden/log-macros.hpp>
#include <libwarden/transcribe/retry.hpp>
#include <thread>

namespace libwarden::transcribe
{

auto RetryPolicy::from_config(const config::RetryConfig& cfg) -> RetryPolicy
{
  RetryPolicy policy;
  policy.max_attempts    = cfg.max_attempts;
  policy.initial_backoff = cfg.initial_backoff;
  policy.max_backoff     = cfg.max_backoff;
  policy.multiplier      = cfg.multiplier;
  policy.jitter          = cfg.jitter;
  return policy;
}

auto RetryPolicy::backoff_for(int attempt, double u) const -> std::chrono::milliseconds
{
  const double base = static_cast<double>(initial_backoff.count()) *
                      std::pow(multiplier, static_cast<double>(std::max(attempt, 1) - 1));
  const double capped   = std::min(base, static_cast<double>(max_backoff.count()));
  const double jittered = capped * (1.0 + jitter * std::clamp(u, -1.0, 1.0));

  // Jitter never pushes a delay past the cap
  const double bounded = std::clamp(jittered, 0.0, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds(std::llround(bounded));
}

RetryingTranscriber::RetryingTranscriber(Transcriber& inner, RetryPolicy policy, Sleeper sleeper)
    : m_inner(inner), m_policy(std::move(policy)), m_sleeper(std::move(sleeper)),
      m_rng(std::random_device{}())
{
  if (!m_sleeper)
    m_sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

auto RetryingTranscriber::transcribe(const std::filesystem::path& audio) -> Transcript
{
  m_attempts = 0;

  for (;;)
  {
    ++m_attempts;
    try
    {
      return m_inner.transcribe(audio);
    }
    catch (const TranscriptionError& e)
    {
      const bool retry = m_policy.retryable && m_policy.retryable(e);

      if (!retry || m_attempts >= m_policy.max_attempts)
      {
        log::ERROR<log::TRANSCRIBE>("Giving up after %1% attempt(s): %2% (status %3%)",
                                    m_attempts, e.what(), e.status());
        throw;
      }

      const auto delay = m_policy.backoff_for(m_attempts, m_jitter(m_rng));
      log::WARN<log::TRANSCRIBE>("Attempt %1%/%2% failed with status %3%, retrying in %4% ms",
                                 m_attempts, m_policy.max_attempts, e.status(), delay.count());
      m_sleeper(delay);
    }
  }
}

} // namespace libwarden::transcribe
