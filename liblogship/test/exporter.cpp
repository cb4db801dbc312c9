//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/exporter.hpp"

#include "logship/encoder.hpp"
#include "logship/error.hpp"
#include "logship/test/fixtures/actor_system.hpp"
#include "logship/test/fixtures/otap.hpp"
#include "logship/test/test.hpp"

#include <caf/event_based_actor.hpp>

#include <deque>
#include <optional>

using namespace std::chrono_literals;
using namespace logship;

namespace {

template <class T>
using reply = std::shared_ptr<std::optional<T>>;

/// Hands out prepared results instead of encoding.
class scripted_encoder final : public encoder {
public:
  using result_type = caf::expected<std::vector<encoded_batch>>;

  explicit scripted_encoder(std::deque<result_type> results)
    : results_{std::move(results)} {
  }

  auto encode(std::span<const log_record> records)
    -> result_type override {
    if (results_.empty())
      return caf::make_error(ec::logic_error, "no scripted result left");
    auto result = std::move(results_.front());
    results_.pop_front();
    if (result)
      for (auto& batch : *result)
        if (not batch.data.empty())
          batch.num_records = records.size();
    return result;
  }

private:
  std::deque<result_type> results_;
};

auto make_batch(std::string_view text) -> encoded_batch {
  auto result = encoded_batch{};
  result.event_name = "Log";
  for (auto c : text)
    result.data.push_back(static_cast<std::byte>(c));
  return result;
}

struct fixture : fixtures::deterministic_actor_system {
  fixture() : script{std::make_shared<fixtures::upload_script>()} {
    uploader = sys.spawn(fixtures::scripted_uploader, script);
  }

  void spawn_exporter(exporter_options options = {},
                      size_t max_batch_bytes
                      = defaults::encoder::max_batch_bytes) {
    auto enc = std::make_shared<ndjson_encoder>(
      ndjson_encoder_options{.max_batch_bytes = max_batch_bytes});
    spawn_exporter(std::move(enc), std::move(options));
  }

  void spawn_exporter(std::shared_ptr<encoder> enc,
                      exporter_options options = {}) {
    exp = sys.spawn(logship::exporter, std::move(options), std::move(enc),
                    uploader);
  }

  auto consume(otap_signal signal) -> reply<caf::error> {
    auto result = std::make_shared<std::optional<caf::error>>();
    sys.spawn([=, hdl = exp](caf::event_based_actor* self) {
      self->mail(atom::consume_v, signal)
        .request(hdl, caf::infinite)
        .then(
          [result] {
            *result = caf::error{};
          },
          [result](caf::error& err) {
            *result = std::move(err);
          });
    });
    dispatch_messages();
    return result;
  }

  auto metrics() -> reply<exporter_metrics> {
    auto result = std::make_shared<std::optional<exporter_metrics>>();
    auto on_error = error_handler();
    sys.spawn([=, hdl = exp](caf::event_based_actor* self) {
      self->mail(atom::metrics_v)
        .request(hdl, caf::infinite)
        .then(
          [result](exporter_metrics& x) {
            *result = std::move(x);
          },
          on_error);
    });
    dispatch_messages();
    return result;
  }

  auto shutdown(caf::timestamp deadline) -> reply<terminal_state> {
    auto result = std::make_shared<std::optional<terminal_state>>();
    auto on_error = error_handler();
    sys.spawn([=, hdl = exp](caf::event_based_actor* self) {
      self->mail(atom::shutdown_v, deadline)
        .request(hdl, caf::infinite)
        .then(
          [result](terminal_state& x) {
            *result = std::move(x);
          },
          on_error);
    });
    dispatch_messages();
    return result;
  }

  std::shared_ptr<fixtures::upload_script> script;
  uploader_actor uploader;
  exporter_actor exp;
};

auto without_retries() -> exporter_options {
  auto options = exporter_options{};
  options.retry.enabled = false;
  return options;
}

auto payload(const encoded_batch& batch) -> std::string {
  return {reinterpret_cast<const char*>(batch.data.data()), batch.data.size()};
}

} // namespace

WITH_FIXTURE(fixture) {
  TEST("acknowledge a signal once its batch uploads") {
    spawn_exporter();
    auto result = consume(fixtures::make_simple_signal(3));
    REQUIRE(*result);
    CHECK(not **result);
    REQUIRE_EQUAL(script->batches.size(), size_t{1});
    CHECK_EQUAL(script->batches[0].event_name, "Log");
    CHECK_EQUAL(script->batches[0].num_records, uint64_t{3});
    CHECK_EQUAL(payload(script->batches[0]), "{\"body\":\"line 0\"}\n"
                                             "{\"body\":\"line 1\"}\n"
                                             "{\"body\":\"line 2\"}\n");
    auto counters = metrics();
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->consumed, uint64_t{1});
    CHECK_EQUAL((*counters)->exported, uint64_t{1});
    CHECK_EQUAL((*counters)->failed, uint64_t{0});
    CHECK_EQUAL((*counters)->records, uint64_t{3});
    CHECK_EQUAL((*counters)->batches_exported, uint64_t{1});
  }

  TEST("a failed batch rejects the signal but later batches still upload") {
    spawn_exporter(without_retries(), 1);
    script->responses = {
      caf::error{},
      caf::make_error(ec::upload_error, "HTTP status 503"),
    };
    auto result = consume(fixtures::make_simple_signal(3));
    REQUIRE(*result);
    CHECK_EQUAL(**result, ec::upload_error);
    CHECK_EQUAL(render(**result), "!! upload_error: failed to upload batch 2/3 "
                                  "HTTP status 503");
    CHECK_EQUAL(script->batches.size(), size_t{3});
    auto counters = metrics();
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->exported, uint64_t{0});
    CHECK_EQUAL((*counters)->failed, uint64_t{1});
    CHECK_EQUAL((*counters)->batches_exported, uint64_t{2});
    CHECK_EQUAL((*counters)->batches_failed, uint64_t{1});
  }

  TEST("retry a batch before acknowledging") {
    spawn_exporter();
    auto transient = caf::make_error(ec::upload_error, "HTTP status 503");
    script->responses = {transient, transient};
    auto result = consume(fixtures::make_simple_signal(1));
    CHECK(not *result);
    advance_time(100ms);
    dispatch_messages();
    CHECK(not *result);
    advance_time(200ms);
    dispatch_messages();
    REQUIRE(*result);
    CHECK(not **result);
    CHECK_EQUAL(script->attempts.size(), size_t{3});
    auto counters = metrics();
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->upload_retries, uint64_t{2});
    CHECK_EQUAL((*counters)->batches_exported, uint64_t{1});
  }

  TEST("shutdown waits for the signal in flight") {
    spawn_exporter();
    script->responses = {caf::make_error(ec::upload_error, "HTTP status 503")};
    auto first = consume(fixtures::make_simple_signal(2));
    CHECK(not *first);
    auto deadline = caf::timestamp{} + 42s;
    auto terminal = shutdown(deadline);
    CHECK(not *terminal);
    MESSAGE("signals behind the shutdown request never upload");
    auto late = consume(fixtures::make_simple_signal(1));
    CHECK(not *late);
    advance_time(100ms);
    dispatch_messages();
    REQUIRE(*first);
    CHECK(not **first);
    REQUIRE(*late);
    CHECK_EQUAL(**late, ec::logic_error);
    REQUIRE(*terminal);
    CHECK_EQUAL((*terminal)->deadline, deadline);
    CHECK_EQUAL((*terminal)->metrics.consumed, uint64_t{2});
    CHECK_EQUAL((*terminal)->metrics.exported, uint64_t{1});
    CHECK_EQUAL((*terminal)->metrics.failed, uint64_t{1});
    CHECK_EQUAL((*terminal)->metrics.upload_retries, uint64_t{1});
    CHECK_EQUAL(script->batches.size(), size_t{2});
  }

  TEST("shutdown while idle stops immediately") {
    spawn_exporter();
    auto deadline = caf::timestamp{} + 1s;
    auto terminal = shutdown(deadline);
    REQUIRE(*terminal);
    CHECK_EQUAL((*terminal)->deadline, deadline);
    CHECK_EQUAL((*terminal)->metrics, exporter_metrics{});
  }

  TEST("reject signals other than logs") {
    spawn_exporter();
    auto traces = fixtures::make_simple_signal(1);
    traces.type = signal_type::traces;
    auto result = consume(std::move(traces));
    REQUIRE(*result);
    CHECK_EQUAL(**result, ec::unsupported_signal);
    auto bytes = otap_signal{signal_type::logs, otlp_bytes{{std::byte{0x0a}}}};
    result = consume(std::move(bytes));
    REQUIRE(*result);
    CHECK_EQUAL(**result, ec::unsupported_signal);
    CHECK(script->attempts.empty());
    auto counters = metrics();
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->consumed, uint64_t{2});
    CHECK_EQUAL((*counters)->failed, uint64_t{2});
  }

  TEST("reject signals without a logs table") {
    spawn_exporter();
    auto result = consume(fixtures::make_signal(nullptr));
    REQUIRE(*result);
    CHECK_EQUAL(**result, ec::decode_error);
    CHECK_CONTAINS(render(**result), "failed to decode signal");
    CHECK(script->attempts.empty());
  }

  TEST("count attribute rows that match no record") {
    spawn_exporter();
    auto logs = fixtures::make_logs({{.body = "hello"}});
    auto attrs = fixtures::make_attrs({
      {.parent_id = 0, .key = "host", .type = 1, .str = "web-1"},
      {.parent_id = 7, .key = "orphan", .type = 1, .str = "x"},
    });
    auto result = consume(fixtures::make_signal(logs, attrs));
    REQUIRE(*result);
    CHECK(not **result);
    REQUIRE_EQUAL(script->batches.size(), size_t{1});
    CHECK_EQUAL(payload(script->batches[0]),
                "{\"body\":\"hello\",\"attributes\":{\"host\":\"web-1\"}}\n");
    auto counters = metrics();
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->dropped_attributes, uint64_t{1});
  }

  TEST("reject signals beyond the queue capacity") {
    auto options = exporter_options{};
    options.upload_queue_size = 1;
    spawn_exporter(options);
    script->responses = {caf::make_error(ec::upload_error, "HTTP status 503")};
    auto first = consume(fixtures::make_simple_signal(1));
    auto second = consume(fixtures::make_simple_signal(1));
    auto third = consume(fixtures::make_simple_signal(1));
    CHECK(not *first);
    CHECK(not *second);
    REQUIRE(*third);
    CHECK_EQUAL(**third, ec::upload_error);
    CHECK_EQUAL(render(**third),
                "!! upload_error: exporter queue is full (1 signals)");
    MESSAGE("metrics requests wait for the signal in flight");
    auto counters = metrics();
    CHECK(not *counters);
    advance_time(100ms);
    dispatch_messages();
    REQUIRE(*first);
    CHECK(not **first);
    REQUIRE(*second);
    CHECK(not **second);
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->consumed, uint64_t{3});
    CHECK_EQUAL((*counters)->rejected, uint64_t{1});
    CHECK_EQUAL((*counters)->failed, uint64_t{1});
    CHECK_EQUAL((*counters)->exported, uint64_t{2});
  }

  TEST("skip empty batches without uploading them") {
    auto results = std::deque<scripted_encoder::result_type>{};
    results.emplace_back(std::vector<encoded_batch>{
      make_batch("a\n"),
      make_batch(""),
      make_batch("b\n"),
    });
    spawn_exporter(std::make_shared<scripted_encoder>(std::move(results)));
    auto result = consume(fixtures::make_simple_signal(2));
    REQUIRE(*result);
    CHECK(not **result);
    REQUIRE_EQUAL(script->batches.size(), size_t{2});
    CHECK_EQUAL(payload(script->batches[0]), "a\n");
    CHECK_EQUAL(payload(script->batches[1]), "b\n");
    auto counters = metrics();
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->exported, uint64_t{1});
    CHECK_EQUAL((*counters)->batches_exported, uint64_t{2});
    CHECK_EQUAL((*counters)->batches_skipped, uint64_t{1});
  }

  TEST("acknowledge a signal whose batches are all empty") {
    auto results = std::deque<scripted_encoder::result_type>{};
    results.emplace_back(std::vector<encoded_batch>{make_batch("")});
    spawn_exporter(std::make_shared<scripted_encoder>(std::move(results)));
    auto result = consume(fixtures::make_simple_signal(1));
    REQUIRE(*result);
    CHECK(not **result);
    CHECK(script->attempts.empty());
    auto counters = metrics();
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->exported, uint64_t{1});
    CHECK_EQUAL((*counters)->batches_skipped, uint64_t{1});
  }

  TEST("reject a signal that fails to encode and keep accepting signals") {
    auto results = std::deque<scripted_encoder::result_type>{};
    results.emplace_back(
      caf::make_error(ec::encode_error, "record exceeds batch size"));
    results.emplace_back(std::vector<encoded_batch>{make_batch("c\n")});
    spawn_exporter(std::make_shared<scripted_encoder>(std::move(results)));
    auto first = consume(fixtures::make_simple_signal(2));
    REQUIRE(*first);
    CHECK_EQUAL(**first, ec::encode_error);
    CHECK_EQUAL(render(**first), "!! encode_error: failed to encode 2 records "
                                 "record exceeds batch size");
    CHECK(script->attempts.empty());
    auto second = consume(fixtures::make_simple_signal(1));
    REQUIRE(*second);
    CHECK(not **second);
    REQUIRE_EQUAL(script->batches.size(), size_t{1});
    CHECK_EQUAL(payload(script->batches[0]), "c\n");
    auto counters = metrics();
    REQUIRE(*counters);
    CHECK_EQUAL((*counters)->consumed, uint64_t{2});
    CHECK_EQUAL((*counters)->failed, uint64_t{1});
    CHECK_EQUAL((*counters)->exported, uint64_t{1});
  }
}
