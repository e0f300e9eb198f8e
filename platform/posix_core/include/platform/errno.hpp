/*
 * Copyright (C) 2020 BlueRock Security, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BlueRock Open-Source License.
 * See the LICENSE-BlueRock file in the repository root for details.
 */
#pragma once

/*! \file Exposes error code compatible with Zeta
 *
 *  We borrow the error codes from the standard errno.h and
 *  redefine Errno::NONE since this is the only one that is not standard.
 */

#include <errno.h>
#include <platform/types.hpp>

enum class Errno {
    NONE = 0,
    PERM = EPERM,
    NOENT = ENOENT,
    NOMEM = ENOMEM,
    FAULT = EFAULT,
    INVAL = EINVAL,
    RANGE = ERANGE,
    ADDR_OVERFLOW = EOVERFLOW,
    NOTSUP = ENOTSUP,
    NOTRECOVERABLE = ENOTRECOVERABLE,
};

static inline constexpr auto
errno2str(Errno e) {
    switch (e) {
    case Errno::NONE:
        return "NONE";
    case Errno::PERM:
        return "PERM";
    case Errno::NOENT:
        return "NOENT";
    case Errno::NOMEM:
        return "NOMEM";
    case Errno::FAULT:
        return "FAULT";
    case Errno::INVAL:
        return "INVAL";
    case Errno::RANGE:
        return "RANGE";
    case Errno::ADDR_OVERFLOW:
        return "ADDR_OVERFLOW";
    case Errno::NOTSUP:
        return "NOTSUP";
    case Errno::NOTRECOVERABLE:
        return "NOTRECOVERABLE";
    }
    return "(invalid)"; // keep outside so compiler will warn on incomplete switch
}
