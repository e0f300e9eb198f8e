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
     * or store issued after it. Guest RAM is normal memory in the inner shareable
     * domain, so DMB ISH orders our accesses against the driver's CPU.
     */
    static inline void rw_before_rw(void) {
        asm volatile("dmb ish" : : : "memory");
    }

}
