//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/log_record.hpp"

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace logship {

/// A surrogate key that joins attribute rows to their owner.
using parent_id = uint16_t;

/// The attributes of every parent, each list in scan order.
using parent_index = std::unordered_map<parent_id, std::vector<attribute>>;

/// Counters describing a single pass over an attribute table.
struct join_stats {
  /// Number of scanned rows.
  uint64_t rows = 0;
  /// Rows that produced an attribute.
  uint64_t joined = 0;
  /// Rows skipped because the parent id was null.
  uint64_t null_parent = 0;
  /// Rows skipped because the key did not resolve.
  uint64_t unresolved_key = 0;
  /// Rows skipped because of an unrecognized type tag.
  uint64_t unknown_type = 0;
  /// Rows skipped because the tag-selected value did not resolve.
  uint64_t missing_value = 0;
  /// Passes that found a required column missing or mistyped.
  uint64_t missing_columns = 0;

  /// Returns the number of rows that did not produce an attribute.
  auto dropped() const -> uint64_t {
    return rows - joined;
  }

  auto operator+=(const join_stats& other) -> join_stats&;
};

/// Scans an attribute table once and groups its attributes by parent.
///
/// The table must provide the columns `key` (dictionary-encoded string) and
/// `type` (uint8), plus a uint16 parent column named `parent_column`. The
/// value of a row comes from `str` (dictionary-encoded string) for type tag
/// 1 and from `int` (dictionary-encoded int64) for type tag 2. Rows with a
/// null parent, an unresolvable key, another tag, or a null value are
/// skipped. A missing or mistyped required column yields an empty index.
/// @param attrs The attribute table.
/// @param parent_column The column holding the parent ids.
/// @param stats Optional counters that receive the outcome of the scan.
auto build_parent_index(const arrow::RecordBatch& attrs,
                        std::string_view parent_column = "parent_id",
                        join_stats* stats = nullptr) -> parent_index;

} // namespace logship
