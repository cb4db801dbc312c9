//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/aliases.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace logship::defaults {

// -- constants for the batch retry policy -------------------------------------
namespace retry {

/// Number of additional attempts after the first failed upload of a batch.
inline constexpr uint32_t max_retries = 3;

/// Delay before the first retry.
inline constexpr duration initial_interval = std::chrono::milliseconds{100};

/// Upper bound for the delay between two attempts.
inline constexpr duration max_interval = std::chrono::seconds{5};

/// Growth factor of the delay after each failed attempt.
inline constexpr double multiplier = 2.0;

/// Whether failed uploads are retried at all.
inline constexpr bool enabled = true;

} // namespace retry

// -- constants for the exporter -----------------------------------------------
namespace exporter {

/// Maximum number of messages the exporter defers while a signal is in flight.
inline constexpr size_t upload_queue_size = 256;

/// Timeout for a single HTTP transfer.
inline constexpr duration upload_timeout = std::chrono::seconds{30};

/// How long an upload request may outlast its HTTP transfer.
inline constexpr duration request_timeout_margin = std::chrono::seconds{5};

} // namespace exporter

// -- constants for the encoder ------------------------------------------------
namespace encoder {

/// Maximum payload size of a single encoded batch.
inline constexpr size_t max_batch_bytes = 1 << 20;

/// Event name for records that do not carry one.
inline constexpr std::string_view event_name = "Log";

} // namespace encoder

// -- constants for the logger -------------------------------------------------
namespace logger {

/// Log format for console output.
inline constexpr const char* console_format = "%^[%T.%e] %v%$";

/// Verbosity for writing to console.
inline constexpr const char* console_verbosity = "info";

/// Maximum number of log messages in the logger queue.
inline constexpr const size_t queue_size = 100;

/// Number of logger threads.
inline constexpr const size_t logger_threads = 1;

} // namespace logger

} // namespace logship::defaults
