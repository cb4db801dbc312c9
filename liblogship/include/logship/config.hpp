//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#define LOGSHIP_LOG_LEVEL_QUIET 0
#define LOGSHIP_LOG_LEVEL_CRITICAL 1
#define LOGSHIP_LOG_LEVEL_ERROR 2
#define LOGSHIP_LOG_LEVEL_WARNING 3
#define LOGSHIP_LOG_LEVEL_INFO 4
#define LOGSHIP_LOG_LEVEL_VERBOSE 5
#define LOGSHIP_LOG_LEVEL_DEBUG 6
#define LOGSHIP_LOG_LEVEL_TRACE 7

// The build system sets the compile-time log level ceiling. Messages above it
// compile to nothing.
#ifndef LOGSHIP_LOG_LEVEL
#  define LOGSHIP_LOG_LEVEL LOGSHIP_LOG_LEVEL_TRACE
#endif

#ifndef LOGSHIP_VERSION
#  define LOGSHIP_VERSION "0.1.0"
#endif

#if defined(__GNUC__) || defined(__clang__)
#  define LOGSHIP_NO_INLINE __attribute__((noinline))
#else
#  define LOGSHIP_NO_INLINE
#endif
