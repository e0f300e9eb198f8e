/*
 * Copyright (C) 2020 BedRock Systems, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

/*! \file
 *  \brief Atomic accesses to memory that is not owned by the C++ abstract machine
 *
 *  Guest memory is shared with an untrusted peer and is only reachable through raw
 *  pointers, so we go through the compiler builtins rather than [std::atomic].
 */

#include <platform/types.hpp>

/*! \brief Memory ordering of a single atomic access
 */
enum class Ordering : int {
    RELAXED = __ATOMIC_RELAXED,
    ACQUIRE = __ATOMIC_ACQUIRE,
    RELEASE = __ATOMIC_RELEASE,
    ACQ_REL = __ATOMIC_ACQ_REL,
    SEQ_CST = __ATOMIC_SEQ_CST,
};

inline const char *
ordering2str(Ordering o) {
    switch (o) {
    case Ordering::RELAXED:
        return "RELAXED";
    case Ordering::ACQUIRE:
        return "ACQUIRE";
    case Ordering::RELEASE:
        return "RELEASE";
    case Ordering::ACQ_REL:
        return "ACQ_REL";
    case Ordering::SEQ_CST:
        return "SEQ_CST";
    }
    return "(invalid)";
}

/*! \brief Can [o] be used for a load?
 */
inline constexpr bool
is_load_ordering(Ordering o) {
    return o == Ordering::RELAXED || o == Ordering::ACQUIRE || o == Ordering::SEQ_CST;
}

/*! \brief Can [o] be used for a store?
 */
inline constexpr bool
is_store_ordering(Ordering o) {
    return o == Ordering::RELAXED || o == Ordering::RELEASE || o == Ordering::SEQ_CST;
}

/*! \brief Atomically load a naturally aligned scalar
 *  \pre [p] is aligned on [sizeof(T)] and [is_load_ordering(o)]
 */
template<typename T>
inline T
atomic_load(const volatile T *p, Ordering o) {
    switch (o) {
    case Ordering::ACQUIRE:
        return __atomic_load_n(p, __ATOMIC_ACQUIRE);
    case Ordering::SEQ_CST:
        return __atomic_load_n(p, __ATOMIC_SEQ_CST);
    default:
        return __atomic_load_n(p, __ATOMIC_RELAXED);
    }
}

/*! \brief Atomically store a naturally aligned scalar
 *  \pre [p] is aligned on [sizeof(T)] and [is_store_ordering(o)]
 */
template<typename T>
inline void
atomic_store(volatile T *p, T v, Ordering o) {
    switch (o) {
    case Ordering::RELEASE:
        __atomic_store_n(p, v, __ATOMIC_RELEASE);
        break;
    case Ordering::SEQ_CST:
        __atomic_store_n(p, v, __ATOMIC_SEQ_CST);
        break;
    default:
        __atomic_store_n(p, v, __ATOMIC_RELAXED);
        break;
    }
}
