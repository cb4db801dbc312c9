//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/exporter.hpp"

#include "logship/detail/overload.hpp"
#include "logship/encoder.hpp"
#include "logship/error.hpp"
#include "logship/logger.hpp"
#include "logship/record_materializer.hpp"
#include "logship/resilient_uploader.hpp"

#include <caf/typed_event_based_actor.hpp>
#include <fmt/chrono.h>

#include <algorithm>
#include <variant>

namespace logship {

auto to_string(exporter_phase x) -> std::string_view {
  switch (x) {
    case exporter_phase::running:
      return "running";
    case exporter_phase::draining:
      return "draining";
    case exporter_phase::stopped:
      return "stopped";
  }
  LOGSHIP_UNREACHABLE();
}

auto exporter_state::process(otap_signal signal,
                             caf::typed_response_promise<void> rp) -> void {
  if (signal.type != signal_type::logs) {
    complete(rp, caf::make_error(ec::unsupported_signal,
                                 fmt::format("{} does not export {}", name,
                                             signal.type)));
    return;
  }
  const auto* batch = std::get_if<otap_batch>(&signal.payload);
  if (not batch) {
    complete(rp, caf::make_error(ec::unsupported_signal,
                                 fmt::format("{} expects Arrow records but "
                                             "got serialized OTLP bytes",
                                             name)));
    return;
  }
  auto stats = decode_stats{};
  auto records = materialize(*batch, &stats);
  metrics.dropped_attributes += stats.dropped_attributes();
  if (not records) {
    complete(rp, add_context(records.error(), "failed to decode signal"));
    return;
  }
  if (stats.dropped_attributes() > 0)
    LOGSHIP_VERBOSE("{} dropped {} attribute rows while decoding {} records",
                    name, stats.dropped_attributes(), records->size());
  metrics.records += records->size();
  auto batches = enc->encode(*records);
  if (not batches) {
    complete(rp, add_context(batches.error(), "failed to encode {} records",
                             records->size()));
    return;
  }
  LOGSHIP_DEBUG("{} encoded {} records into {} batches", name, records->size(),
                batches->size());
  busy = true;
  auto pending = std::make_shared<pending_signal>();
  pending->rp = std::move(rp);
  pending->batches = std::move(*batches);
  upload_next(std::move(pending));
}

auto exporter_state::upload_next(std::shared_ptr<pending_signal> pending)
  -> void {
  const auto total = pending->batches.size();
  while (pending->next < total
         and pending->batches[pending->next].data.empty()) {
    LOGSHIP_DEBUG("{} skips empty batch {}/{}", name, pending->next + 1, total);
    ++metrics.batches_skipped;
    ++pending->next;
  }
  if (pending->next == total) {
    complete(pending->rp, std::move(pending->first_error));
    return;
  }
  const auto index = pending->next++;
  auto on_retry = [this, index, total](uint32_t attempt, const caf::error& err,
                                       duration delay) {
    ++metrics.upload_retries;
    LOGSHIP_VERBOSE("{} retries batch {}/{} in {} after attempt {} failed: {}",
                    name, index + 1, total, delay, attempt, err);
  };
  auto on_done = [this, pending, index, total](caf::error err) {
    if (err) {
      ++metrics.batches_failed;
      LOGSHIP_WARN("{} failed to upload batch {}/{}: {}", name, index + 1,
                   total, err);
      if (not pending->first_error)
        pending->first_error
          = add_context(err, "failed to upload batch {}/{}", index + 1, total);
    } else {
      ++metrics.batches_exported;
    }
    upload_next(pending);
  };
  upload_with_retry(self, uploader, std::move(pending->batches[index]),
                    options.retry, options.upload_timeout, std::move(on_retry),
                    std::move(on_done));
}

auto exporter_state::complete(caf::typed_response_promise<void>& rp,
                              caf::error err) -> void {
  if (err) {
    ++metrics.failed;
    LOGSHIP_WARN("{} rejects signal: {}", name, err);
    rp.deliver(std::move(err));
  } else {
    ++metrics.exported;
    rp.deliver();
  }
  busy = false;
  resume();
}

auto exporter_state::resume() -> void {
  if (resuming)
    return;
  resuming = true;
  while (not busy and not deferred.empty()
         and phase != exporter_phase::stopped) {
    auto next = std::move(deferred.front());
    deferred.pop_front();
    std::visit(detail::overload{
                 [&](std::pair<otap_signal, caf::typed_response_promise<void>>&
                       x) {
                   process(std::move(x.first), std::move(x.second));
                 },
                 [&](caf::typed_response_promise<exporter_metrics>& rp) {
                   rp.deliver(metrics);
                 },
                 [&](std::pair<caf::timestamp,
                               caf::typed_response_promise<terminal_state>>&
                       x) {
                   stop(x.first, std::move(x.second));
                 },
               },
               next);
  }
  resuming = false;
}

auto exporter_state::stop(caf::timestamp deadline,
                          caf::typed_response_promise<terminal_state> rp)
  -> void {
  phase = exporter_phase::stopped;
  for (auto& next : deferred) {
    if (auto* x = std::get_if<0>(&next)) {
      ++metrics.failed;
      x->second.deliver(caf::make_error(
        ec::logic_error,
        fmt::format("{} stopped before processing the signal", name)));
    }
  }
  LOGSHIP_VERBOSE("{} stops after exporting {} and failing {} of {} signals",
                  name, metrics.exported, metrics.failed, metrics.consumed);
  const auto result = terminal_state{deadline, metrics};
  rp.deliver(result);
  for (auto& next : deferred) {
    if (auto* metrics_rp = std::get_if<1>(&next))
      metrics_rp->deliver(metrics);
    else if (auto* shutdown = std::get_if<2>(&next))
      shutdown->second.deliver(result);
  }
  deferred.clear();
  self->quit();
}

auto exporter(exporter_actor::stateful_pointer<exporter_state> self,
              exporter_options options, std::shared_ptr<encoder> enc,
              uploader_actor uploader) -> exporter_actor::behavior_type {
  self->state().self = self;
  self->state().options = std::move(options);
  self->state().enc = std::move(enc);
  self->state().uploader = std::move(uploader);
  return {
    [self](atom::consume, otap_signal& signal) -> caf::result<void> {
      auto& state = self->state();
      ++state.metrics.consumed;
      auto rp = self->make_response_promise<void>();
      if (not state.busy) {
        state.process(std::move(signal), rp);
        return rp;
      }
      const auto queued = static_cast<size_t>(
        std::count_if(state.deferred.begin(), state.deferred.end(),
                      [](const deferred_message& x) {
                        return x.index() == 0;
                      }));
      if (queued >= state.options.upload_queue_size) {
        ++state.metrics.failed;
        ++state.metrics.rejected;
        LOGSHIP_WARN("{} rejects {} signal because {} signals are queued",
                     exporter_state::name, signal.type, queued);
        rp.deliver(caf::make_error(ec::upload_error,
                                   fmt::format("{} queue is full ({} signals)",
                                               exporter_state::name, queued)));
        return rp;
      }
      state.deferred.emplace_back(std::in_place_index<0>, std::move(signal),
                                  rp);
      return rp;
    },
    [self](atom::metrics) -> caf::result<exporter_metrics> {
      auto& state = self->state();
      if (not state.busy)
        return state.metrics;
      auto rp = self->make_response_promise<exporter_metrics>();
      state.deferred.emplace_back(std::in_place_index<1>, rp);
      return rp;
    },
    [self](atom::shutdown,
           caf::timestamp deadline) -> caf::result<terminal_state> {
      auto& state = self->state();
      auto rp = self->make_response_promise<terminal_state>();
      if (not state.busy) {
        state.stop(deadline, rp);
        return rp;
      }
      if (state.phase == exporter_phase::running)
        LOGSHIP_VERBOSE("{} drains before shutting down", exporter_state::name);
      state.phase = exporter_phase::draining;
      state.deferred.emplace_back(std::in_place_index<2>, deadline, rp);
      return rp;
    },
  };
}

} // namespace logship
