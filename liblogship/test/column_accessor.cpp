//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/column_accessor.hpp"

#include "logship/test/fixtures/otap.hpp"
#include "logship/test/test.hpp"

#include <arrow/builder.h>

using namespace std::chrono_literals;
using namespace logship;
using namespace logship::fixtures;

TEST("missing columns resolve to nullptr") {
  auto batch = make_batch({{"flags", make_uint16s({1, 2})}});
  CHECK(column(*batch, "flags") != nullptr);
  CHECK(column(*batch, "severity_text") == nullptr);
  CHECK(not as_uint16(column(*batch, "severity_text")));
  CHECK_EQUAL(describe(nullptr), "<missing>");
}

TEST("narrowing rejects mismatched layouts") {
  auto numbers = make_uint16s({1});
  CHECK(as_uint16(numbers));
  CHECK(not as_uint8(numbers));
  CHECK(not as_uint32(numbers));
  CHECK(not as_timestamp(numbers));
  CHECK(not as_string(numbers));
  CHECK(not as_binary(numbers));
  CHECK(not as_struct(numbers));
  CHECK(not as_string_dictionary(numbers));
  MESSAGE("a dictionary only narrows to its value type");
  auto dict = encode_strings({"a", "b"});
  CHECK(as_string_dictionary(dict));
  CHECK(not as_int32_dictionary(dict));
  CHECK(not as_int64_dictionary(dict));
}

TEST("numeric columns") {
  auto builder = arrow::UInt32Builder{};
  check(builder.Append(7));
  check(builder.AppendNull());
  auto column = unbox(as_uint32(check(builder.Finish())));
  CHECK_EQUAL(column.length(), 2);
  CHECK_EQUAL(column.value_at(0), std::optional<uint32_t>{7});
  CHECK_EQUAL(column.value_at(1), std::optional<uint32_t>{});
  MESSAGE("rows outside the column are absent");
  CHECK_EQUAL(column.value_at(-1), std::optional<uint32_t>{});
  CHECK_EQUAL(column.value_at(2), std::optional<uint32_t>{});
}

TEST("timestamps of every unit") {
  auto nanos = unbox(as_timestamp(make_timestamps({1'500, std::nullopt})));
  CHECK_EQUAL(nanos.value_at(0)->time_since_epoch(), duration{1'500});
  CHECK(not nanos.value_at(1));
  auto seconds = unbox(
    as_timestamp(make_timestamps({2}, arrow::TimeUnit::SECOND)));
  CHECK_EQUAL(seconds.value_at(0)->time_since_epoch(), duration{2s});
  auto millis = unbox(
    as_timestamp(make_timestamps({3}, arrow::TimeUnit::MILLI)));
  CHECK_EQUAL(millis.value_at(0)->time_since_epoch(), duration{3ms});
  auto micros = unbox(
    as_timestamp(make_timestamps({4}, arrow::TimeUnit::MICRO)));
  CHECK_EQUAL(micros.value_at(0)->time_since_epoch(), duration{4us});
}

TEST("dictionary lookups are bounded") {
  auto values = make_strings({"debug", "info"});
  auto dict = unbox(
    as_string_dictionary(make_dictionary({1, 0, std::nullopt, 2, -1}, values)));
  CHECK_EQUAL(dict.length(), 5);
  CHECK_EQUAL(unbox(dict.value_at(0)), "info");
  CHECK_EQUAL(unbox(dict.value_at(1)), "debug");
  MESSAGE("null keys resolve to nothing");
  CHECK(not dict.value_at(2));
  MESSAGE("keys past the dictionary resolve to nothing");
  CHECK(not dict.index_at(3));
  CHECK(not dict.value_at(3));
  CHECK(not dict.value_at(4));
  MESSAGE("rows past the index array resolve to nothing");
  CHECK(not dict.value_at(5));
}

TEST("dictionary with null values") {
  auto dict = unbox(as_int64_dictionary(
    make_dictionary({0, 1}, make_int64s({std::nullopt, 42}))));
  CHECK_EQUAL(dict.index_at(0), std::optional<int64_t>{0});
  CHECK(not dict.value_at(0));
  CHECK_EQUAL(dict.value_at(1), std::optional<int64_t>{42});
}

TEST("strings may be plain or dictionary-encoded") {
  auto plain = unbox(as_string(make_strings({"a", std::nullopt})));
  CHECK_EQUAL(unbox(plain.value_at(0)), "a");
  CHECK(not plain.value_at(1));
  CHECK(not plain.value_at(2));
  auto encoded = unbox(as_string(encode_strings({"b", "b", std::nullopt})));
  CHECK_EQUAL(unbox(encoded.value_at(1)), "b");
  CHECK(not encoded.value_at(2));
}

TEST("binary columns") {
  auto variable = [] {
    auto builder = arrow::BinaryBuilder{};
    check(builder.Append(std::string_view{"\x01\x02", 2}));
    check(builder.AppendNull());
    return check(builder.Finish());
  }();
  auto column = unbox(as_binary(variable));
  auto bytes = unbox(column.value_at(0));
  REQUIRE_EQUAL(bytes.size(), size_t{2});
  CHECK_EQUAL(std::to_integer<int>(bytes[0]), 1);
  CHECK_EQUAL(std::to_integer<int>(bytes[1]), 2);
  CHECK(not column.value_at(1));
  auto fixed = [] {
    auto builder = arrow::FixedSizeBinaryBuilder{arrow::fixed_size_binary(4)};
    check(builder.Append("abcd"));
    return check(builder.Finish());
  }();
  auto fixed_column = unbox(as_binary(fixed));
  CHECK_EQUAL(unbox(fixed_column.value_at(0)).size(), size_t{4});
}

TEST("struct columns") {
  auto logs = make_logs({{.body = "hello", .resource_id = 7},
                         {.body = std::nullopt}});
  auto body = unbox(as_struct(column(*logs, "body")));
  CHECK(body.is_valid(0));
  CHECK(not body.is_valid(1));
  CHECK(not body.is_valid(2));
  CHECK(body.field("str") != nullptr);
  CHECK(body.field("int") == nullptr);
  auto resource = unbox(as_struct(column(*logs, "resource")));
  auto ids = unbox(as_uint16(resource.field("id")));
  CHECK_EQUAL(ids.value_at(0), std::optional<uint16_t>{7});
}
