//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#include "logship/actors.hpp"
#include "logship/aliases.hpp"
#include "logship/atoms.hpp"
#include "logship/encoder.hpp"
#include "logship/error.hpp"
#include "logship/retry_policy.hpp"

#include <caf/error.hpp>
#include <caf/timespan.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace logship {

/// Observes a failed attempt that will be retried. Receives the number of the
/// failed attempt, its error, and the delay before the next attempt.
using retry_observer
  = std::function<void(uint32_t, const caf::error&, duration)>;

/// Receives the final outcome of an upload sequence.
using upload_callback = std::function<void(caf::error)>;

namespace detail {

/// The state of one batch moving through its attempts.
template <class Self>
struct upload_sequence : std::enable_shared_from_this<upload_sequence<Self>> {
  upload_sequence(Self* self, uploader_actor uploader, encoded_batch batch,
                  const retry_policy& policy, caf::timespan timeout,
                  retry_observer on_retry, upload_callback on_done)
    : self{self},
      uploader{std::move(uploader)},
      batch{std::move(batch)},
      schedule{policy},
      timeout{timeout},
      on_retry{std::move(on_retry)},
      on_done{std::move(on_done)} {
  }

  void attempt() {
    self->mail(atom::upload_v, batch)
      .request(uploader, timeout)
      .then(
        [seq = this->shared_from_this()] {
          seq->finish({});
        },
        [seq = this->shared_from_this()](caf::error& err) {
          seq->fail(std::move(err));
        });
  }

  void fail(caf::error err) {
    const auto failed_attempt = schedule.attempt();
    auto delay = schedule.fail();
    if (not delay) {
      finish(std::move(err));
      return;
    }
    if (on_retry)
      on_retry(failed_attempt, err, *delay);
    if (*delay <= duration::zero()) {
      attempt();
      return;
    }
    // Waits on the actor clock instead of blocking the thread.
    self->run_delayed_weak(*delay, [seq = this->shared_from_this()] {
      seq->attempt();
    });
  }

  void finish(caf::error err) {
    auto done = std::exchange(on_done, {});
    if (done)
      done(std::move(err));
  }

  Self* self;
  uploader_actor uploader;
  encoded_batch batch;
  backoff schedule;
  caf::timespan timeout;
  retry_observer on_retry;
  upload_callback on_done;
};

} // namespace detail

/// Uploads a batch, retrying failed attempts with exponential backoff.
///
/// The first attempt starts immediately. After a failed attempt, the sequence
/// either waits for the next backoff delay and tries again, or reports the
/// error of the last attempt unmodified once `policy` permits no further
/// attempts. Waiting never blocks the calling actor's thread.
/// @param self The actor that drives the sequence.
/// @param uploader The actor that transmits a batch.
/// @param batch The batch to upload. Must not be empty.
/// @param policy The retry policy.
/// @param timeout The timeout of a single attempt.
/// @param on_retry Invoked for each failed attempt that is retried.
/// @param on_done Invoked exactly once with the final outcome.
template <class Self>
void upload_with_retry(Self* self, uploader_actor uploader,
                       encoded_batch batch, const retry_policy& policy,
                       caf::timespan timeout, retry_observer on_retry,
                       upload_callback on_done) {
  if (batch.data.empty()) {
    on_done(caf::make_error(ec::logic_error,
                            fmt::format("refusing to upload empty batch for "
                                        "event {}",
                                        batch.event_name)));
    return;
  }
  auto seq = std::make_shared<detail::upload_sequence<Self>>(
    self, std::move(uploader), std::move(batch), policy, timeout,
    std::move(on_retry), std::move(on_done));
  seq->attempt();
}

} // namespace logship
