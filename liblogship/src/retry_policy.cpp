//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/retry_policy.hpp"

#include "logship/error.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace logship {

auto retry_policy::max_attempts() const -> uint32_t {
  if (not enabled or max_retries == 0)
    return 1;
  if (max_retries == std::numeric_limits<uint32_t>::max())
    return max_retries;
  return max_retries + 1;
}

auto retry_policy::next_interval(duration delay) const -> duration {
  using fractional = std::chrono::duration<double, duration::period>;
  auto grown = fractional{delay} * multiplier;
  // Saturate instead of overflowing the integer representation.
  if (grown.count() >= static_cast<double>(duration::max().count()))
    return max_interval == duration::zero() ? duration::max() : max_interval;
  auto next = std::chrono::duration_cast<duration>(grown);
  if (max_interval == duration::zero())
    return next;
  return std::min(next, max_interval);
}

auto retry_policy::validate() const -> caf::error {
  if (not std::isfinite(multiplier) or multiplier <= 0.0)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("retry multiplier must be a positive "
                                       "number, got {}",
                                       multiplier));
  if (initial_interval < duration::zero())
    return caf::make_error(ec::invalid_configuration,
                           "retry initial_interval must not be negative");
  if (max_interval < duration::zero())
    return caf::make_error(ec::invalid_configuration,
                           "retry max_interval must not be negative");
  return {};
}

backoff::backoff(const retry_policy& policy)
  : policy_{policy}, delay_{policy.initial_interval} {
}

auto backoff::exhausted() const -> bool {
  return attempt_ >= policy_.max_attempts();
}

auto backoff::fail() -> std::optional<duration> {
  if (exhausted())
    return std::nullopt;
  auto result = delay_;
  delay_ = policy_.next_interval(delay_);
  ++attempt_;
  return result;
}

} // namespace logship
