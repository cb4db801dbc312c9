//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "logship/fwd.hpp"

#define LOGSHIP_ADD_ATOM(name, text)                                           \
  CAF_ADD_ATOM(logship_atoms, logship::atom, name, text)

CAF_BEGIN_TYPE_ID_BLOCK(logship_atoms, caf::id_block::logship_types::end)

  LOGSHIP_ADD_ATOM(consume, "consume")
  LOGSHIP_ADD_ATOM(metrics, "metrics")
  LOGSHIP_ADD_ATOM(shutdown, "shutdown")
  LOGSHIP_ADD_ATOM(upload, "upload")

CAF_END_TYPE_ID_BLOCK(logship_atoms)
