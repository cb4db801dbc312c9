//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/detail/add_message_types.hpp"

#include "logship/actors.hpp"
#include "logship/atoms.hpp"
#include "logship/encoder.hpp"
#include "logship/error.hpp"
#include "logship/metrics.hpp"
#include "logship/signal.hpp"

#include <caf/init_global_meta_objects.hpp>

namespace logship::detail {

void add_message_types() {
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::logship_types>();
  caf::init_global_meta_objects<caf::id_block::logship_atoms>();
}

} // namespace logship::detail
