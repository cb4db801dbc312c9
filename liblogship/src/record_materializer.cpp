//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/record_materializer.hpp"

#include "logship/column_accessor.hpp"
#include "logship/error.hpp"
#include "logship/logger.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace logship {

namespace {

/// Narrows a scalar column of the primary table. An absent or mismatched
/// column only leaves the corresponding field empty.
template <class Narrow>
auto lookup(const arrow::RecordBatch& logs, std::string_view name,
            Narrow narrow, decode_stats& stats) {
  auto array = column(logs, name);
  auto result = narrow(array);
  if (not result) {
    ++stats.unresolved_columns;
    LOGSHIP_DEBUG("ignoring column {} with layout {}", name, describe(array));
  }
  return result;
}

} // namespace

auto resource_ids(const arrow::RecordBatch& logs)
  -> std::vector<std::optional<parent_id>> {
  auto result = std::vector<std::optional<parent_id>>(
    static_cast<size_t>(logs.num_rows()));
  auto resource = as_struct(column(logs, "resource"));
  if (not resource)
    return result;
  auto ids = as_uint16(resource->field("id"));
  if (not ids)
    return result;
  for (auto row = int64_t{0}; row < logs.num_rows(); ++row) {
    if (resource->is_valid(row))
      result[row] = ids->value_at(row);
  }
  return result;
}

auto materialize(const otap_batch& batch, decode_stats* stats)
  -> caf::expected<std::vector<log_record>> {
  if (not batch.logs)
    return caf::make_error(ec::decode_error,
                           "no primary data: signal carries no logs table");
  auto local = decode_stats{};
  auto& counters = stats ? *stats : local;
  const auto& logs = *batch.logs;
  const auto rows = logs.num_rows();
  counters.rows += rows;
  auto time_unix_nano = lookup(logs, "time_unix_nano", as_timestamp, counters);
  auto observed_time_unix_nano
    = lookup(logs, "observed_time_unix_nano", as_timestamp, counters);
  auto severity_number
    = lookup(logs, "severity_number", as_int32_dictionary, counters);
  auto severity_text = lookup(logs, "severity_text", as_string, counters);
  auto trace_id = lookup(logs, "trace_id", as_binary, counters);
  auto span_id = lookup(logs, "span_id", as_binary, counters);
  auto flags = lookup(logs, "flags", as_uint32, counters);
  auto body = lookup(logs, "body", as_struct, counters);
  auto body_str = std::optional<string_column>{};
  if (body) {
    body_str = as_string(body->field("str"));
    if (not body_str) {
      ++counters.unresolved_columns;
      LOGSHIP_DEBUG("ignoring column body.str with layout {}",
                    describe(body->field("str")));
    }
  }
  // Most producers do not send event names, so their absence is expected.
  auto event_name = as_string(column(logs, "event_name"));
  auto records = std::vector<log_record>{};
  records.reserve(static_cast<size_t>(rows));
  for (auto row = int64_t{0}; row < rows; ++row) {
    auto& record = records.emplace_back();
    if (time_unix_nano)
      record.time_unix_nano = time_unix_nano->value_at(row);
    if (observed_time_unix_nano)
      record.observed_time_unix_nano = observed_time_unix_nano->value_at(row);
    if (severity_number)
      record.severity_number = severity_number->value_at(row);
    if (severity_text) {
      if (auto text = severity_text->value_at(row))
        record.severity_text.emplace(*text);
    }
    if (body_str and body->is_valid(row)) {
      if (auto str = body_str->value_at(row))
        record.body.emplace(std::in_place_type<std::string>, *str);
    }
    if (trace_id) {
      if (auto bytes = trace_id->value_at(row))
        record.trace_id.assign(bytes->begin(), bytes->end());
    }
    if (span_id) {
      if (auto bytes = span_id->value_at(row))
        record.span_id.assign(bytes->begin(), bytes->end());
    }
    if (flags)
      record.flags = flags->value_at(row);
    if (event_name) {
      if (auto name = event_name->value_at(row))
        record.event_name.emplace(*name);
    }
  }
  if (batch.log_attrs) {
    auto index
      = build_parent_index(*batch.log_attrs, "parent_id", &counters.log_attrs);
    // Every parent addresses a distinct record, so the iteration order of the
    // index does not affect the order within a record.
    for (auto& [parent, attributes] : index) {
      if (parent >= rows) {
        counters.orphaned_log_attrs += attributes.size();
        continue;
      }
      auto& target = records[parent].attributes;
      std::move(attributes.begin(), attributes.end(),
                std::back_inserter(target));
    }
  }
  if (batch.resource_attrs) {
    auto ids = resource_ids(logs);
    auto index = build_parent_index(*batch.resource_attrs, "parent_id",
                                    &counters.resource_attrs);
    for (auto row = int64_t{0}; row < rows; ++row) {
      const auto& id = ids[row];
      if (not id) {
        ++counters.rows_without_resource;
        continue;
      }
      auto it = index.find(*id);
      if (it == index.end())
        continue;
      auto& target = records[row].attributes;
      target.insert(target.end(), it->second.begin(), it->second.end());
    }
  }
  LOGSHIP_DEBUG("decoded {} log records with {} log and {} resource "
                "attributes ({} dropped, {} unknown type tags)",
                rows, counters.log_attrs.joined,
                counters.resource_attrs.joined, counters.dropped_attributes(),
                counters.log_attrs.unknown_type
                  + counters.resource_attrs.unknown_type);
  return records;
}

} // namespace logship
