/*
 * Copyright (C) 2020-2025 BlueRock Security, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BlueRock Open-Source License.
 * See the LICENSE-BlueRock file in the repository root for details.
 */
#pragma once

/*! \file
 *  \brief Wrapper around Compiler provided builtins
 *
 *  We expect the following definitions:
 *  - __UNLIKELY__
 *  - ARRAY_LENGTH
 */

#define __UNLIKELY__(x) __builtin_expect(!!(x), 0)

#define ARRAY_LENGTH(x) (sizeof(x) / sizeof((x)[0]))
