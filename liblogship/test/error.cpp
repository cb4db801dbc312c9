//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "logship/error.hpp"

#include "logship/test/test.hpp"

#include <caf/pec.hpp>
#include <caf/sec.hpp>

using namespace std::string_literals;
using namespace logship;

TEST("error to_string") {
  auto str = [](auto x) {
    return to_string(x);
  };
  CHECK_EQUAL(str(ec::no_error), "no_error"s);
  CHECK_EQUAL(str(ec::unspecified), "unspecified"s);
  CHECK_EQUAL(str(ec::decode_error), "decode_error"s);
  CHECK_EQUAL(str(ec::encode_error), "encode_error"s);
  CHECK_EQUAL(str(ec::upload_error), "upload_error"s);
  CHECK_EQUAL(str(ec::unsupported_signal), "unsupported_signal"s);
  CHECK_EQUAL(str(ec::invalid_configuration), "invalid_configuration"s);
  CHECK_EQUAL(str(ec::parse_error), "parse_error"s);
  CHECK_EQUAL(str(ec::filesystem_error), "filesystem_error"s);
  CHECK_EQUAL(str(ec::logic_error), "logic_error"s);
  CHECK_EQUAL(str(ec::unimplemented), "unimplemented"s);
}

TEST("render") {
  CHECK_EQUAL(render(caf::make_error(ec::unspecified)), "!! unspecified");
  CHECK_EQUAL(render(caf::make_error(ec::decode_error, "msg")),
              "!! decode_error: msg");
  CHECK_EQUAL(render(caf::make_error(ec::upload_error, "test with", "multiple",
                                     "messages")),
              "!! upload_error: test with multiple messages");
  CHECK_EQUAL(render(caf::make_error(caf::pec::type_mismatch, "ttt")),
              "!! type_mismatch: ttt");
  CHECK_EQUAL(render(caf::make_error(caf::sec::unexpected_message, "msg")),
              "!! unexpected_message: msg");
  CHECK_EQUAL(render(caf::error{}), "");
}

TEST("add context") {
  auto err = caf::make_error(ec::upload_error, "HTTP status 503");
  auto with_context = add_context(err, "failed to upload batch {}/{}", 2, 3);
  CHECK_EQUAL(with_context, ec::upload_error);
  CHECK_EQUAL(render(with_context),
              "!! upload_error: failed to upload batch 2/3 HTTP status 503");
  MESSAGE("errors without context receive one");
  CHECK_EQUAL(render(add_context(caf::make_error(ec::encode_error), "stage")),
              "!! encode_error: stage");
  MESSAGE("the empty error stays empty");
  CHECK(not add_context(caf::error{}, "ignored"));
}

TEST("format errors") {
  CHECK_EQUAL(fmt::format("{}", caf::make_error(ec::parse_error, "bad")),
              "!! parse_error: bad");
}
