//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/aliases.hpp"
#include "logship/defaults.hpp"

#include <caf/error.hpp>

#include <cstdint>
#include <optional>

namespace logship {

/// Governs how often and how fast a failed batch upload is retried.
struct retry_policy {
  /// Additional attempts after the first one.
  uint32_t max_retries = defaults::retry::max_retries;
  /// The delay before the first retry.
  duration initial_interval = defaults::retry::initial_interval;
  /// The upper bound for delays. Zero means unbounded.
  duration max_interval = defaults::retry::max_interval;
  /// The factor by which the delay grows after each failed attempt.
  double multiplier = defaults::retry::multiplier;
  /// Whether to retry at all.
  bool enabled = defaults::retry::enabled;

  /// Returns the total number of attempts per batch, including the first.
  auto max_attempts() const -> uint32_t;

  /// Returns the delay that follows `delay` after another failed attempt.
  auto next_interval(duration delay) const -> duration;

  /// Checks that the policy describes a usable backoff.
  auto validate() const -> caf::error;

  friend auto operator==(const retry_policy&, const retry_policy&) -> bool
    = default;
};

/// Tracks the attempts of a single batch under a retry policy.
class backoff {
public:
  explicit backoff(const retry_policy& policy);

  /// Returns the number of the current attempt, starting at 1.
  auto attempt() const -> uint32_t {
    return attempt_;
  }

  /// Returns whether the current attempt is the last permitted one.
  auto exhausted() const -> bool;

  /// Registers a failure of the current attempt and advances to the next.
  /// @returns the delay to wait before the next attempt, or `std::nullopt`
  /// if the failure was terminal.
  auto fail() -> std::optional<duration>;

private:
  retry_policy policy_;
  uint32_t attempt_ = 1;
  duration delay_;
};

} // namespace logship
