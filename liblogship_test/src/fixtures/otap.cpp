//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/test/fixtures/otap.hpp"

#include "logship/arrow_utils.hpp"

#include <arrow/buffer.h>
#include <arrow/builder.h>
#include <arrow/util/bit_util.h>
#include <fmt/format.h>

#include <unordered_map>

namespace logship::fixtures {

namespace {

template <class Builder, class T>
auto build(Builder& builder, const std::vector<std::optional<T>>& xs)
  -> std::shared_ptr<arrow::Array> {
  for (const auto& x : xs) {
    if (x)
      check(builder.Append(*x));
    else
      check(builder.AppendNull());
  }
  return check(builder.Finish());
}

/// Returns a validity bitmap that marks the rows with a value as valid.
template <class T>
auto validity(const std::vector<std::optional<T>>& xs)
  -> std::pair<std::shared_ptr<arrow::Buffer>, int64_t> {
  auto bitmap = check(arrow::AllocateBitmap(static_cast<int64_t>(xs.size())));
  auto nulls = int64_t{0};
  for (auto i = size_t{0}; i < xs.size(); ++i) {
    arrow::bit_util::SetBitTo(bitmap->mutable_data(), static_cast<int64_t>(i),
                              xs[i].has_value());
    if (not xs[i])
      ++nulls;
  }
  return {std::move(bitmap), nulls};
}

auto make_struct(const std::string& field, std::shared_ptr<arrow::Array> child,
                 std::shared_ptr<arrow::Buffer> bitmap, int64_t nulls)
  -> std::shared_ptr<arrow::Array> {
  return check(arrow::StructArray::Make({std::move(child)}, {field},
                                        std::move(bitmap), nulls));
}

} // namespace

auto make_batch(const std::vector<named_column>& columns)
  -> std::shared_ptr<arrow::RecordBatch> {
  auto fields = arrow::FieldVector{};
  auto arrays = arrow::ArrayVector{};
  auto rows = int64_t{0};
  for (const auto& [name, array] : columns) {
    fields.push_back(arrow::field(name, array->type()));
    arrays.push_back(array);
    rows = array->length();
  }
  return arrow::RecordBatch::Make(arrow::schema(std::move(fields)), rows,
                                  std::move(arrays));
}

auto make_dictionary(const std::vector<std::optional<int32_t>>& indices,
                     std::shared_ptr<arrow::Array> values)
  -> std::shared_ptr<arrow::Array> {
  auto index_array = make_int32s(indices);
  auto type = arrow::dictionary(arrow::int32(), values->type());
  return std::make_shared<arrow::DictionaryArray>(type, std::move(index_array),
                                                  std::move(values));
}

auto make_strings(const std::vector<std::optional<std::string>>& xs)
  -> std::shared_ptr<arrow::Array> {
  auto builder = arrow::StringBuilder{};
  return build(builder, xs);
}

auto make_int32s(const std::vector<std::optional<int32_t>>& xs)
  -> std::shared_ptr<arrow::Array> {
  auto builder = arrow::Int32Builder{};
  return build(builder, xs);
}

auto make_int64s(const std::vector<std::optional<int64_t>>& xs)
  -> std::shared_ptr<arrow::Array> {
  auto builder = arrow::Int64Builder{};
  return build(builder, xs);
}

auto make_uint8s(const std::vector<std::optional<uint8_t>>& xs)
  -> std::shared_ptr<arrow::Array> {
  auto builder = arrow::UInt8Builder{};
  return build(builder, xs);
}

auto make_uint16s(const std::vector<std::optional<uint16_t>>& xs)
  -> std::shared_ptr<arrow::Array> {
  auto builder = arrow::UInt16Builder{};
  return build(builder, xs);
}

auto make_timestamps(const std::vector<std::optional<int64_t>>& xs,
                     arrow::TimeUnit::type unit)
  -> std::shared_ptr<arrow::Array> {
  auto builder = arrow::TimestampBuilder{arrow::timestamp(unit),
                                         arrow::default_memory_pool()};
  return build(builder, xs);
}

auto encode_strings(const std::vector<std::optional<std::string>>& xs)
  -> std::shared_ptr<arrow::Array> {
  auto indices = std::vector<std::optional<int32_t>>{};
  auto values = std::vector<std::optional<std::string>>{};
  auto seen = std::unordered_map<std::string, int32_t>{};
  for (const auto& x : xs) {
    if (not x) {
      indices.emplace_back();
      continue;
    }
    auto [it, inserted]
      = seen.try_emplace(*x, static_cast<int32_t>(values.size()));
    if (inserted)
      values.emplace_back(*x);
    indices.emplace_back(it->second);
  }
  return make_dictionary(indices, make_strings(values));
}

namespace {

template <class T>
auto encode_numbers(const std::vector<std::optional<T>>& xs,
                    std::shared_ptr<arrow::Array> (*make)(
                      const std::vector<std::optional<T>>&))
  -> std::shared_ptr<arrow::Array> {
  auto indices = std::vector<std::optional<int32_t>>{};
  auto values = std::vector<std::optional<T>>{};
  auto seen = std::unordered_map<T, int32_t>{};
  for (const auto& x : xs) {
    if (not x) {
      indices.emplace_back();
      continue;
    }
    auto [it, inserted]
      = seen.try_emplace(*x, static_cast<int32_t>(values.size()));
    if (inserted)
      values.emplace_back(*x);
    indices.emplace_back(it->second);
  }
  return make_dictionary(indices, make(values));
}

} // namespace

auto make_logs(const std::vector<log_row>& rows, bool with_event_name)
  -> std::shared_ptr<arrow::RecordBatch> {
  auto times = std::vector<std::optional<int64_t>>{};
  auto observed = std::vector<std::optional<int64_t>>{};
  auto severity_numbers = std::vector<std::optional<int32_t>>{};
  auto severity_texts = std::vector<std::optional<std::string>>{};
  auto bodies = std::vector<std::optional<std::string>>{};
  auto flags = std::vector<std::optional<uint32_t>>{};
  auto resources = std::vector<std::optional<uint16_t>>{};
  auto event_names = std::vector<std::optional<std::string>>{};
  auto trace_ids = arrow::BinaryBuilder{};
  auto span_ids = arrow::BinaryBuilder{};
  for (const auto& row : rows) {
    times.push_back(row.time_unix_nano);
    observed.push_back(row.observed_time_unix_nano);
    severity_numbers.push_back(row.severity_number);
    severity_texts.push_back(row.severity_text);
    bodies.push_back(row.body);
    flags.push_back(row.flags);
    resources.push_back(row.resource_id);
    event_names.push_back(row.event_name);
    if (row.trace_id)
      check(trace_ids.Append(*row.trace_id));
    else
      check(trace_ids.AppendNull());
    if (row.span_id)
      check(span_ids.Append(*row.span_id));
    else
      check(span_ids.AppendNull());
  }
  auto flags_builder = arrow::UInt32Builder{};
  auto [body_bitmap, body_nulls] = validity(bodies);
  auto [resource_bitmap, resource_nulls] = validity(resources);
  auto columns = std::vector<named_column>{
    {"time_unix_nano", make_timestamps(times)},
    {"observed_time_unix_nano", make_timestamps(observed)},
    {"severity_number", encode_numbers<int32_t>(severity_numbers, make_int32s)},
    {"severity_text", encode_strings(severity_texts)},
    {"body", make_struct("str", make_strings(bodies), body_bitmap, body_nulls)},
    {"trace_id", check(trace_ids.Finish())},
    {"span_id", check(span_ids.Finish())},
    {"flags", build(flags_builder, flags)},
    {"resource", make_struct("id", make_uint16s(resources), resource_bitmap,
                             resource_nulls)},
  };
  if (with_event_name)
    columns.emplace_back("event_name", encode_strings(event_names));
  return make_batch(columns);
}

auto make_attrs(const std::vector<attr_row>& rows)
  -> std::shared_ptr<arrow::RecordBatch> {
  auto parents = std::vector<std::optional<uint16_t>>{};
  auto keys = std::vector<std::optional<std::string>>{};
  auto types = std::vector<std::optional<uint8_t>>{};
  auto strs = std::vector<std::optional<std::string>>{};
  auto ints = std::vector<std::optional<int64_t>>{};
  for (const auto& row : rows) {
    parents.push_back(row.parent_id);
    keys.push_back(row.key);
    types.emplace_back(row.type);
    strs.push_back(row.str);
    ints.push_back(row.integer);
  }
  return make_batch({
    {"parent_id", make_uint16s(parents)},
    {"key", encode_strings(keys)},
    {"type", make_uint8s(types)},
    {"str", encode_strings(strs)},
    {"int", encode_numbers<int64_t>(ints, make_int64s)},
  });
}

auto make_signal(std::shared_ptr<arrow::RecordBatch> logs,
                 std::shared_ptr<arrow::RecordBatch> log_attrs,
                 std::shared_ptr<arrow::RecordBatch> resource_attrs)
  -> otap_signal {
  return otap_signal{
    .type = signal_type::logs,
    .payload = otap_batch{
      .logs = std::move(logs),
      .log_attrs = std::move(log_attrs),
      .resource_attrs = std::move(resource_attrs),
    },
  };
}

auto make_simple_signal(size_t n) -> otap_signal {
  auto rows = std::vector<log_row>{};
  for (auto i = size_t{0}; i < n; ++i)
    rows.push_back(log_row{.body = fmt::format("line {}", i)});
  return make_signal(make_logs(rows));
}

} // namespace logship::fixtures
