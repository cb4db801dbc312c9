//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace logship {

/// A duration with nanosecond resolution.
using duration = std::chrono::duration<int64_t, std::nano>;

/// An absolute point in time with nanosecond resolution.
using time = std::chrono::time_point<std::chrono::system_clock, duration>;

/// A sequence of raw bytes.
using blob = std::vector<std::byte>;

} // namespace logship
