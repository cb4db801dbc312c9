//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/test/fixtures/actor_system.hpp"

#include <caf/typed_event_based_actor.hpp>

namespace logship::fixtures {

auto scripted_uploader(uploader_actor::pointer self,
                       std::shared_ptr<upload_script> script)
  -> uploader_actor::behavior_type {
  return {
    [self, script](atom::upload,
                   const encoded_batch& batch) -> caf::result<void> {
      const auto index = script->attempts.size();
      script->attempts.push_back(self->now());
      script->batches.push_back(batch);
      if (index < script->responses.size() and script->responses[index])
        return script->responses[index];
      return {};
    },
  };
}

} // namespace logship::fixtures
