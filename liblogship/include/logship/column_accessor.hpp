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

#include <arrow/array.h>
#include <arrow/record_batch.h>
#include <arrow/type.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// The accessors in this file isolate all knowledge about the physical layout
// of the columns. Every lookup degrades to an empty optional when a column is
// absent, has an unexpected layout, or holds a null cell. None of them throw.

namespace logship {

/// Returns the column named `name`, or `nullptr` if the batch has none.
auto column(const arrow::RecordBatch& batch, std::string_view name)
  -> std::shared_ptr<arrow::Array>;

/// Converts a raw timestamp value of the given unit to a time point.
auto to_time(int64_t value, arrow::TimeUnit::type unit) -> time;

/// Returns a human-readable description of a column's layout for diagnostics.
auto describe(const std::shared_ptr<arrow::Array>& array) -> std::string;

/// Returns true if `row` addresses a slot of `array`.
inline auto in_bounds(const arrow::Array& array, int64_t row) -> bool {
  return row >= 0 and row < array.length();
}

/// A timestamp column of any time unit.
class timestamp_column {
public:
  explicit timestamp_column(std::shared_ptr<arrow::TimestampArray> array);

  auto length() const -> int64_t {
    return array_->length();
  }

  auto value_at(int64_t row) const -> std::optional<time>;

private:
  std::shared_ptr<arrow::TimestampArray> array_;
  arrow::TimeUnit::type unit_;
};

/// A column of fixed-width integers.
template <class ArrowType>
class numeric_column {
public:
  using array_type = arrow::NumericArray<ArrowType>;
  using value_type = typename ArrowType::c_type;

  explicit numeric_column(std::shared_ptr<array_type> array)
    : array_{std::move(array)} {
  }

  auto length() const -> int64_t {
    return array_->length();
  }

  auto value_at(int64_t row) const -> std::optional<value_type> {
    if (not in_bounds(*array_, row) or array_->IsNull(row))
      return std::nullopt;
    return array_->Value(row);
  }

private:
  std::shared_ptr<array_type> array_;
};

using uint8_column = numeric_column<arrow::UInt8Type>;
using uint16_column = numeric_column<arrow::UInt16Type>;
using uint32_column = numeric_column<arrow::UInt32Type>;

/// A dictionary-encoded column. Resolving a row takes two bounded lookups:
/// the row into the index array and the index into the dictionary.
template <class ValueArray>
class dictionary_column {
public:
  using value_type
    = decltype(std::declval<const ValueArray&>().GetView(int64_t{}));

  dictionary_column(std::shared_ptr<arrow::DictionaryArray> array,
                    std::shared_ptr<ValueArray> values)
    : array_{std::move(array)}, values_{std::move(values)} {
  }

  auto length() const -> int64_t {
    return array_->length();
  }

  /// Returns the dictionary index of a row, if the row holds a valid key.
  auto index_at(int64_t row) const -> std::optional<int64_t> {
    if (not in_bounds(*array_, row) or array_->IsNull(row))
      return std::nullopt;
    auto index = array_->GetValueIndex(row);
    if (not in_bounds(*values_, index))
      return std::nullopt;
    return index;
  }

  auto value_at(int64_t row) const -> std::optional<value_type> {
    auto index = index_at(row);
    if (not index or values_->IsNull(*index))
      return std::nullopt;
    return values_->GetView(*index);
  }

private:
  std::shared_ptr<arrow::DictionaryArray> array_;
  std::shared_ptr<ValueArray> values_;
};

using string_dictionary_column = dictionary_column<arrow::StringArray>;
using int32_dictionary_column = dictionary_column<arrow::Int32Array>;
using int64_dictionary_column = dictionary_column<arrow::Int64Array>;

/// A string column that is either plain or dictionary-encoded.
class string_column {
public:
  using value_type = std::string_view;

  explicit string_column(std::shared_ptr<arrow::StringArray> array);

  explicit string_column(string_dictionary_column column);

  auto value_at(int64_t row) const -> std::optional<std::string_view>;

private:
  std::variant<std::shared_ptr<arrow::StringArray>, string_dictionary_column>
    column_;
};

/// A column of raw bytes, either variable-size or fixed-size binary.
class binary_column {
public:
  using value_type = std::span<const std::byte>;

  explicit binary_column(std::shared_ptr<arrow::BinaryArray> array);

  explicit binary_column(std::shared_ptr<arrow::FixedSizeBinaryArray> array);

  auto value_at(int64_t row) const -> std::optional<value_type>;

private:
  std::variant<std::shared_ptr<arrow::BinaryArray>,
               std::shared_ptr<arrow::FixedSizeBinaryArray>>
    array_;
};

/// A nested column with named children.
class struct_column {
public:
  explicit struct_column(std::shared_ptr<arrow::StructArray> array);

  auto length() const -> int64_t {
    return array_->length();
  }

  /// Returns whether the struct itself is non-null at `row`.
  auto is_valid(int64_t row) const -> bool {
    return in_bounds(*array_, row) and array_->IsValid(row);
  }

  /// Returns the child column `name`, or `nullptr` if there is none.
  auto field(std::string_view name) const -> std::shared_ptr<arrow::Array>;

private:
  std::shared_ptr<arrow::StructArray> array_;
};

// -- narrowing ----------------------------------------------------------------

auto as_timestamp(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<timestamp_column>;

template <class ArrowType>
auto as_numeric(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<numeric_column<ArrowType>> {
  if (not array or array->type_id() != ArrowType::type_id)
    return std::nullopt;
  return numeric_column<ArrowType>{
    std::static_pointer_cast<arrow::NumericArray<ArrowType>>(array)};
}

inline auto as_uint8(const std::shared_ptr<arrow::Array>& array) {
  return as_numeric<arrow::UInt8Type>(array);
}

inline auto as_uint16(const std::shared_ptr<arrow::Array>& array) {
  return as_numeric<arrow::UInt16Type>(array);
}

inline auto as_uint32(const std::shared_ptr<arrow::Array>& array) {
  return as_numeric<arrow::UInt32Type>(array);
}

/// Narrows to a dictionary column whose dictionary is a `ValueArray`. The
/// index type may be any integer type.
template <class ValueArray>
auto as_dictionary(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<dictionary_column<ValueArray>> {
  if (not array or array->type_id() != arrow::Type::DICTIONARY)
    return std::nullopt;
  auto dict = std::static_pointer_cast<arrow::DictionaryArray>(array);
  auto values = dict->dictionary();
  if (not values
      or values->type_id() != ValueArray::TypeClass::type_id)
    return std::nullopt;
  return dictionary_column<ValueArray>{
    std::move(dict), std::static_pointer_cast<ValueArray>(values)};
}

inline auto as_string_dictionary(const std::shared_ptr<arrow::Array>& array) {
  return as_dictionary<arrow::StringArray>(array);
}

inline auto as_int32_dictionary(const std::shared_ptr<arrow::Array>& array) {
  return as_dictionary<arrow::Int32Array>(array);
}

inline auto as_int64_dictionary(const std::shared_ptr<arrow::Array>& array) {
  return as_dictionary<arrow::Int64Array>(array);
}

/// Accepts plain and dictionary-encoded strings.
auto as_string(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<string_column>;

auto as_binary(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<binary_column>;

auto as_struct(const std::shared_ptr<arrow::Array>& array)
  -> std::optional<struct_column>;

} // namespace logship
