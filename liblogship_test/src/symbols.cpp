//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

// The test runner provides its own main function in main.cpp.
#define CAF_TEST_NO_MAIN
#include "logship/test/test.hpp"

namespace logship::test {

std::set<std::string> config;

} // namespace logship::test
