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

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace logship {

/// The type tags of the attribute tables.
enum class attribute_tag : uint8_t {
  string = 1,
  integer = 2,
};

/// The value of an attribute. Attribute rows with an unrecognized type tag
/// never produce a value.
using attribute_value = std::variant<std::string, int64_t>;

/// A single key-value pair attached to a log record.
struct attribute {
  std::string key;
  attribute_value value;

  friend auto operator==(const attribute&, const attribute&) -> bool = default;
};

/// The body of a log record. Only string bodies exist at the moment.
using log_body = std::variant<std::string>;

/// One decoded log entry.
struct log_record {
  std::optional<time> time_unix_nano;
  std::optional<time> observed_time_unix_nano;
  std::optional<int32_t> severity_number;
  std::optional<std::string> severity_text;
  std::optional<log_body> body;
  blob trace_id;
  blob span_id;
  std::optional<uint32_t> flags;
  /// Log attributes first, then resource attributes, both in scan order.
  std::vector<attribute> attributes;
  std::optional<std::string> event_name;

  friend auto operator==(const log_record&, const log_record&) -> bool
    = default;
};

} // namespace logship
