/**
 * Copyright (C) 2020 BedRock Systems, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

namespace Barrier {

    /*
     * Every load and store issued before the barrier completes before any load
     * or store issued after it. On x86 this is the one ordering that needs a
     * fence instruction: a store followed by a load of another location.
     */
    static inline void rw_before_rw(void) { asm volatile("mfence" : : : "memory"); }

}
