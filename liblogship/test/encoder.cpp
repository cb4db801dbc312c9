//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/encoder.hpp"

#include "logship/error.hpp"
#include "logship/test/test.hpp"

#include <string_view>

using namespace std::chrono_literals;
using namespace logship;

namespace {

auto payload(const encoded_batch& batch) -> std::string_view {
  return {reinterpret_cast<const char*>(batch.data.data()), batch.data.size()};
}

auto named(std::string body, std::optional<std::string> event_name = {})
  -> log_record {
  auto result = log_record{};
  result.body.emplace(std::move(body));
  result.event_name = std::move(event_name);
  return result;
}

} // namespace

TEST("render a record as JSON") {
  auto record = log_record{};
  record.time_unix_nano = time{1'500ns};
  record.observed_time_unix_nano = time{2'000ns};
  record.severity_number = 17;
  record.severity_text = "ERROR";
  record.body.emplace("disk \"full\"\n");
  record.trace_id = {std::byte{0x0a}, std::byte{0xff}};
  record.span_id = {std::byte{0x01}};
  record.flags = 1;
  record.attributes = {
    {"path", attribute_value{std::string{"/var"}}},
    {"free", attribute_value{int64_t{0}}},
  };
  CHECK_EQUAL(to_json(record),
              R"({"time_unix_nano":1500,"observed_time_unix_nano":2000,)"
              R"("severity_number":17,"severity_text":"ERROR",)"
              R"("body":"disk \"full\"\n","trace_id":"0aff","span_id":"01",)"
              R"("flags":1,"attributes":{"path":"/var","free":0}})");
}

TEST("absent fields are omitted") {
  CHECK_EQUAL(to_json(log_record{}), "{}");
  auto record = log_record{};
  record.event_name = "Audit";
  record.body.emplace(std::string{"\x01"});
  CHECK_EQUAL(to_json(record), R"({"body":"\u0001","event_name":"Audit"})");
}

TEST("invalid UTF-8 becomes replacement characters") {
  auto record = log_record{};
  record.body.emplace(std::string{"caf\xc3\xa9 \xff!"});
  CHECK_EQUAL(to_json(record), "{\"body\":\"caf\xc3\xa9 \\ufffd!\"}");
  MESSAGE("a truncated sequence replaces each of its bytes");
  record.body.emplace(std::string{"\xe2\x82"});
  CHECK_EQUAL(to_json(record), R"({"body":"\ufffd\ufffd"})");
  MESSAGE("overlong encodings are invalid");
  record.body.emplace(std::string{"\xc0\xaf"});
  CHECK_EQUAL(to_json(record), R"({"body":"\ufffd\ufffd"})");
  MESSAGE("keys get the same treatment");
  record.attributes = {{"k\x80", attribute_value{int64_t{1}}}};
  record.body.reset();
  CHECK_EQUAL(to_json(record), R"({"attributes":{"k\ufffd":1}})");
}

TEST("no records yield no batches") {
  auto encoder = ndjson_encoder{};
  auto batches = unbox(encoder.encode({}));
  CHECK(batches.empty());
}

TEST("group records by event name in order of appearance") {
  auto records = std::vector<log_record>{
    named("a"),
    named("b", "Audit"),
    named("c"),
    named("d", "Audit"),
  };
  auto encoder = ndjson_encoder{};
  auto batches = unbox(encoder.encode(records));
  REQUIRE_EQUAL(batches.size(), size_t{2});
  CHECK_EQUAL(batches[0].event_name, "Log");
  CHECK_EQUAL(batches[0].num_records, 2u);
  CHECK_EQUAL(payload(batches[0]), "{\"body\":\"a\"}\n{\"body\":\"c\"}\n");
  CHECK_EQUAL(batches[1].event_name, "Audit");
  CHECK_EQUAL(batches[1].num_records, 2u);
  CHECK_EQUAL(payload(batches[1]),
              "{\"body\":\"b\",\"event_name\":\"Audit\"}\n"
              "{\"body\":\"d\",\"event_name\":\"Audit\"}\n");
}

TEST("split groups that exceed the batch size") {
  auto records = std::vector<log_record>{
    named("1"), named("2"), named("3"), named("oversized record body"),
  };
  // Every short line takes 13 bytes including the newline.
  auto encoder = ndjson_encoder{{.max_batch_bytes = 26}};
  auto batches = unbox(encoder.encode(records));
  REQUIRE_EQUAL(batches.size(), size_t{3});
  CHECK_EQUAL(batches[0].num_records, 2u);
  CHECK_EQUAL(batches[1].num_records, 1u);
  MESSAGE("an oversized record forms its own batch");
  CHECK_EQUAL(batches[2].num_records, 1u);
  CHECK_GREATER(batches[2].data.size(), size_t{26});
}

TEST("custom default event name") {
  auto encoder = ndjson_encoder{{.default_event_name = "Trace"}};
  auto batches = unbox(encoder.encode(std::vector{named("x")}));
  REQUIRE_EQUAL(batches.size(), size_t{1});
  CHECK_EQUAL(batches[0].event_name, "Trace");
}

TEST("zero batch size is an encode error") {
  auto encoder = ndjson_encoder{{.max_batch_bytes = 0}};
  auto batches = encoder.encode(std::vector{named("x")});
  REQUIRE(not batches);
  CHECK_EQUAL(batches.error(), ec::encode_error);
}
