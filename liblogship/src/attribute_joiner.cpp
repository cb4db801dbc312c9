//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/attribute_joiner.hpp"

#include "logship/column_accessor.hpp"
#include "logship/logger.hpp"

#include <optional>
#include <string>

namespace logship {

auto join_stats::operator+=(const join_stats& other) -> join_stats& {
  rows += other.rows;
  joined += other.joined;
  null_parent += other.null_parent;
  unresolved_key += other.unresolved_key;
  unknown_type += other.unknown_type;
  missing_value += other.missing_value;
  missing_columns += other.missing_columns;
  return *this;
}

auto build_parent_index(const arrow::RecordBatch& attrs,
                        std::string_view parent_column, join_stats* stats)
  -> parent_index {
  auto local = join_stats{};
  auto& counters = stats ? *stats : local;
  auto result = parent_index{};
  auto parents = as_uint16(column(attrs, parent_column));
  auto keys = as_string_dictionary(column(attrs, "key"));
  auto types = as_uint8(column(attrs, "type"));
  if (not parents or not keys or not types) {
    LOGSHIP_WARN("skipping attribute table with {} rows: expected uint16 {}, "
                 "dictionary key, and uint8 type columns but got {}, {}, {}",
                 attrs.num_rows(), parent_column,
                 describe(column(attrs, parent_column)),
                 describe(column(attrs, "key")),
                 describe(column(attrs, "type")));
    ++counters.missing_columns;
    counters.rows += static_cast<uint64_t>(attrs.num_rows());
    return result;
  }
  // The value columns are optional: a table may carry only one kind.
  auto strings = as_string_dictionary(column(attrs, "str"));
  auto ints = as_int64_dictionary(column(attrs, "int"));
  const auto rows = attrs.num_rows();
  for (auto row = int64_t{0}; row < rows; ++row) {
    ++counters.rows;
    auto parent = parents->value_at(row);
    if (not parent) {
      ++counters.null_parent;
      continue;
    }
    auto key = keys->value_at(row);
    if (not key) {
      ++counters.unresolved_key;
      continue;
    }
    auto value = std::optional<attribute_value>{};
    switch (types->value_at(row).value_or(0)) {
      case static_cast<uint8_t>(attribute_tag::string):
        if (strings) {
          if (auto str = strings->value_at(row))
            value.emplace(std::in_place_type<std::string>, *str);
        }
        break;
      case static_cast<uint8_t>(attribute_tag::integer):
        if (ints) {
          if (auto integer = ints->value_at(row))
            value.emplace(std::in_place_type<int64_t>, *integer);
        }
        break;
      default:
        ++counters.unknown_type;
        continue;
    }
    if (not value) {
      ++counters.missing_value;
      continue;
    }
    result[*parent].push_back(attribute{std::string{*key}, std::move(*value)});
    ++counters.joined;
  }
  return result;
}

} // namespace logship
