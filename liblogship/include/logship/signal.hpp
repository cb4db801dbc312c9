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

#include <arrow/record_batch.h>
#include <caf/allowed_unsafe_message_type.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <string_view>
#include <type_traits>
#include <variant>

namespace logship {

/// The kinds of telemetry an upstream producer may emit.
enum class signal_type : uint8_t {
  logs,
  traces,
  metrics,
};

/// @relates signal_type
auto to_string(signal_type x) -> std::string_view;

template <class Inspector>
auto inspect(Inspector& f, signal_type& x) {
  using underlying = std::underlying_type_t<signal_type>;
  auto get = [&] {
    return static_cast<underlying>(x);
  };
  auto set = [&](underlying value) {
    if (value > static_cast<underlying>(signal_type::metrics))
      return false;
    x = static_cast<signal_type>(value);
    return true;
  };
  return f.apply(get, set);
}

/// The tables of one OTAP log payload. Only `logs` is mandatory.
struct otap_batch {
  /// The primary table with one row per log record.
  std::shared_ptr<arrow::RecordBatch> logs;
  /// Attributes whose parent id is a row of `logs`.
  std::shared_ptr<arrow::RecordBatch> log_attrs;
  /// Attributes whose parent id is a resource id of `logs`.
  std::shared_ptr<arrow::RecordBatch> resource_attrs;
};

/// A serialized OTLP protobuf payload.
struct otlp_bytes {
  blob data;
};

/// One unit of telemetry handed to the exporter.
struct otap_signal {
  signal_type type = signal_type::logs;
  std::variant<otap_batch, otlp_bytes> payload;
};

} // namespace logship

CAF_ALLOW_UNSAFE_MESSAGE_TYPE(logship::otap_signal)

template <>
struct fmt::formatter<logship::signal_type> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(logship::signal_type x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(logship::to_string(x), ctx);
  }
};
