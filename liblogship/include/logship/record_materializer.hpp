//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/attribute_joiner.hpp"
#include "logship/log_record.hpp"
#include "logship/signal.hpp"

#include <caf/expected.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace logship {

/// Counters describing the decoding of one OTAP batch.
struct decode_stats {
  /// Rows of the primary table, i.e., produced records.
  uint64_t rows = 0;
  /// Scalar columns that were absent or had an unexpected layout.
  uint64_t unresolved_columns = 0;
  /// The scan over the log attribute table.
  join_stats log_attrs;
  /// The scan over the resource attribute table.
  join_stats resource_attrs;
  /// Log attributes whose parent id does not address a row.
  uint64_t orphaned_log_attrs = 0;
  /// Rows without a resolvable resource id.
  uint64_t rows_without_resource = 0;

  /// Returns the total number of attribute rows that reached no record.
  auto dropped_attributes() const -> uint64_t {
    return log_attrs.dropped() + resource_attrs.dropped() + orphaned_log_attrs;
  }
};

/// Extracts the resource id of every row from the nested `resource.id`
/// column. Rows with a null resource or id map to an empty optional.
auto resource_ids(const arrow::RecordBatch& logs)
  -> std::vector<std::optional<parent_id>>;

/// Decodes the primary table of `batch` into one record per row, in row
/// order, and attaches log attributes followed by resource attributes.
/// Missing attribute tables are not an error.
/// @returns the records or `ec::decode_error` if `batch.logs` is absent.
auto materialize(const otap_batch& batch, decode_stats* stats = nullptr)
  -> caf::expected<std::vector<log_record>>;

} // namespace logship
