//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/config.hpp"

#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstdint>

#define LOGSHIP_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(logship_types, type)

// -- arrow --------------------------------------------------------------------

namespace arrow {

class Array;
class RecordBatch;

} // namespace arrow

// -- logship ------------------------------------------------------------------

namespace logship {

class encoder;
class exporter_state;
class http_uploader_state;
class ndjson_encoder;

struct attribute;
struct decode_stats;
struct encoded_batch;
struct exporter_config;
struct exporter_metrics;
struct join_stats;
struct log_record;
struct otap_batch;
struct otap_signal;
struct retry_policy;
struct terminal_state;

enum class auth_method : uint8_t;
enum class ec : uint8_t;
enum class signal_type : uint8_t;

} // namespace logship

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_logship_type_id = 900;

CAF_BEGIN_TYPE_ID_BLOCK(logship_types, first_logship_type_id)

  LOGSHIP_ADD_TYPE_ID((logship::ec))
  LOGSHIP_ADD_TYPE_ID((logship::encoded_batch))
  LOGSHIP_ADD_TYPE_ID((logship::exporter_metrics))
  LOGSHIP_ADD_TYPE_ID((logship::otap_signal))
  LOGSHIP_ADD_TYPE_ID((logship::signal_type))
  LOGSHIP_ADD_TYPE_ID((logship::terminal_state))

CAF_END_TYPE_ID_BLOCK(logship_types)
