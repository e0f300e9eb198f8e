/*
 * Copyright (C) 2020 BedRock Systems, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

#include <platform/types.hpp>

// NOTE: [align] must be a power of two
inline constexpr uint64_t
align_up(uint64_t addr, uint64_t align) {
    return (addr + (align - 1)) & ~(align - 1);
}

// NOTE: [align] must be a power of two
inline constexpr bool
is_aligned(uint64_t addr, uint64_t align) {
    return (addr & (align - 1)) == 0;
}

inline constexpr bool
is_pow2(uint64_t val) {
    return val != 0 && (val & (val - 1)) == 0;
}

inline constexpr uint64
combine_low_high(uint32 low, uint32 high) {
    return static_cast<uint64>(low) | (static_cast<uint64>(high) << 32);
}

inline constexpr uint32
low32(uint64 val) {
    return static_cast<uint32>(val);
}

inline constexpr uint32
high32(uint64 val) {
    return static_cast<uint32>(val >> 32);
}
