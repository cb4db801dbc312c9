//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace logship::detail {

/// Registers the type ID blocks of logship with CAF. Must run before creating
/// an actor system.
void add_message_types();

} // namespace logship::detail
