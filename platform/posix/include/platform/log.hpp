/*
 * Copyright (C) 2020 BlueRock Security, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BlueRock Open-Source License.
 * See the LICENSE-BlueRock file in the repository root for details.
 */
#pragma once

/*! \file
 *  \brief Logging mechanism exposed by the platform
 *
 *  We expect the following macros to be exposed:
 *  - #define DEBUG(_fmt_, ...)
 *  - #define INFO(_fmt_, ...)
 *  - #define WARN(_fmt_, ...)
 *  - #define ERROR(_fmt_, ...)
 */
// NOLINTBEGIN(readability-identifier-naming)

#include <cinttypes>
#include <cstdio>

#include <platform/compiler.hpp>
#include <platform/errno.hpp>

// GCC only learned about __FILE_NAME__ in version 12.
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

#define FMTx64 "0x%" PRIx64
#define FMTu64 "%" PRIu64
#define FMTd64 "%" PRId64
#define FMTx32 "0x%" PRIx32
#define FMTu32 "%" PRIu32
#define FMTd32 "%" PRId32

#define _LOG(_FILE_STREAM_, _LVL_STR_, _FMT_, ...)                                                                               \
    fprintf(_FILE_STREAM_, "[%s][%s:%u] " _FMT_ "\n", _LVL_STR_, __FILE_NAME__, __LINE__, ##__VA_ARGS__);
#define DEBUG(_FMT_, ...) _LOG(stdout, "DBG", _FMT_, ##__VA_ARGS__)
#define INFO(_FMT_, ...) _LOG(stdout, "INF", _FMT_, ##__VA_ARGS__)
#define WARN(_FMT_, ...) _LOG(stdout, "WRN", _FMT_, ##__VA_ARGS__)
#define ERROR(_FMT_, ...) _LOG(stderr, "ERR", _FMT_, ##__VA_ARGS__)

// DEBUG will add the file and line number, emulating a poor man's stacktrace.
// We also print the expression that lead to the failure.
#define TRY_ERRNO_LOG(_expr_)                                                                                                    \
    do {                                                                                                                         \
        Errno ___err = _expr_;                                                                                                   \
        if (__UNLIKELY__(___err != Errno::NONE)) {                                                                               \
            DEBUG("Expression failed with %s: `%s`", errno2str(___err), #_expr_);                                                \
            return ___err;                                                                                                       \
        }                                                                                                                        \
    } while (0)

// Evaluate the result of [expr] which should be of type [Errno].
// If not [NONE] then print an ERROR message and return with that value from the current scope.
#define TRY_ERRNO_ERR(_expr_)                                                                                                    \
    do {                                                                                                                         \
        Errno ___err = _expr_;                                                                                                   \
        if (__UNLIKELY__(___err != Errno::NONE)) {                                                                               \
            ERROR("Expression '%s' failed: %s", #_expr_, errno2str(___err));                                                     \
            return ___err;                                                                                                       \
        }                                                                                                                        \
    } while (0)

// NOLINTEND(readability-identifier-naming)
