//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/column_accessor.hpp"

#include <chrono>
#include <string>

namespace logship {

auto column(const arrow::RecordBatch& batch, std::string_view name)
  -> std::shared_ptr<arrow::Array> {
  return batch.GetColumnByName(std::string{name});
}

auto to_time(int64_t value, arrow::TimeUnit::type unit) -> time {
  switch (unit) {
    case arrow::TimeUnit::SECOND:
      return time{std::chrono::seconds{value}};
    case arrow::TimeUnit::MILLI:
      return time{std::chrono::milliseconds{value}};
    case arrow::TimeUnit::MICRO:
      return time{std::chrono::microseconds{value}};
    case arrow::TimeUnit::NANO:
      return time{std::chrono::nanoseconds{value}};
  }
  return time{std::chrono::nanoseconds{value}};
}

auto describe(const std::shared_ptr<arrow::Array>& array) -> std::string {
  if (not array)
    return "<missing>";
  return array->type()->ToString();
}

timestamp_column::timestamp_column(std::shared_ptr<arrow::TimestampArray> array)
  : array_{std::move(array)},
    unit_{std::static_pointer_cast<arrow::TimestampType>(array_->type())
            ->unit()} {
}

auto timestamp_column::value_at(int64_t row) const -> std::optional<time> {
  if (not in_bounds(*array_, row) or array_->IsNull(row))
    return std::nullopt;
  return to_time(array_->Value(row), unit_);
}

string_column::string_column(std::shared_ptr<arrow::StringArray> array)
  : column_{std::move(array)} {
}

string_column::string_column(string_dictionary_column column)
  : column_{std::move(column)} {
}

auto string_column::value_at(int64_t row) const
  -> std::optional<std::string_view> {
  if (const auto* plain
      = std::get_if<std::shared_ptr<arrow::StringArray>>(&column_)) {
    const auto& array = **plain;
    if (not in_bounds(array, row) or array.IsNull(row))
      return std::nullopt;
    return array.GetView(row);
  }
  return std::get<string_dictionary_column>(column_).value_at(row);
}

binary_column::binary_column(std::shared_ptr<arrow::BinaryArray> array)
  : array_{std::move(array)} {
}

binary_column::binary_column(std::shared_ptr<arrow::FixedSizeBinaryArray> array)
  : array_{std::move(array)} {
}

auto binary_column::value_at(int64_t row) const -> std::optional<value_type> {
  return std::visit(
    [&](const auto& array) -> std::optional<value_type> {
      if (not in_bounds(*array, row) or array->IsNull(row))
        return std::nullopt;
      auto view = array->GetView(row);
      return std::as_bytes(std::span{view.data(), view.size()});
    },
    array_);
}

struct_column::struct_column(std::shared_ptr<arrow::StructArray> array)
  : array_{std::move(array)} {
}

auto struct_column::field(std::string_view name) const
  -> std::shared_ptr<arrow::Array> {
  return array_->GetFieldByName(std::string{name});
}

auto as_timestamp(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<timestamp_column> {
  if (not array or array->type_id() != arrow::Type::TIMESTAMP)
    return std::nullopt;
  return timestamp_column{
    std::static_pointer_cast<arrow::TimestampArray>(array)};
}

auto as_string(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<string_column> {
  if (not array)
    return std::nullopt;
  if (array->type_id() == arrow::Type::STRING)
    return string_column{std::static_pointer_cast<arrow::StringArray>(array)};
  if (auto dict = as_string_dictionary(array))
    return string_column{std::move(*dict)};
  return std::nullopt;
}

auto as_binary(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<binary_column> {
  if (not array)
    return std::nullopt;
  switch (array->type_id()) {
    case arrow::Type::BINARY:
      return binary_column{std::static_pointer_cast<arrow::BinaryArray>(array)};
    case arrow::Type::FIXED_SIZE_BINARY:
      return binary_column{
        std::static_pointer_cast<arrow::FixedSizeBinaryArray>(array)};
    default:
      return std::nullopt;
  }
}

auto as_struct(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<struct_column> {
  if (not array or array->type_id() != arrow::Type::STRUCT)
    return std::nullopt;
  return struct_column{std::static_pointer_cast<arrow::StructArray>(array)};
}

} // namespace logship
