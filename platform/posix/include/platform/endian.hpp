/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

/*! \file
 *  \brief Conversion between host byte order and the little-endian byte order used
 *  by VIRTIO structures in guest memory.
 */

#include <platform/types.hpp>

namespace Endian {
    inline constexpr uint8 swap(uint8 v) { return v; }
    inline constexpr uint16 swap(uint16 v) { return __builtin_bswap16(v); }
    inline constexpr uint32 swap(uint32 v) { return __builtin_bswap32(v); }
    inline constexpr uint64 swap(uint64 v) { return __builtin_bswap64(v); }

    template<typename T>
    inline constexpr T to_le(T v) {
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        return v;
#else
        return swap(v);
#endif
    }

    template<typename T>
    inline constexpr T from_le(T v) {
        return to_le(v);
    }
};

/*! \brief Scalar stored in little-endian byte order
 *
 * Layout-compatible with [T] so that it can be used as a field of structures that
 * mirror guest memory.
 */
template<typename T>
class Little_endian {
public:
    constexpr Little_endian() {}
    constexpr explicit Little_endian(T v) : _raw(Endian::to_le(v)) {}

    constexpr T get() const { return Endian::from_le(_raw); }
    void set(T v) { _raw = Endian::to_le(v); }

    constexpr T raw() const { return _raw; }

private:
    T _raw{0};
};

static_assert(sizeof(Little_endian<uint16>) == sizeof(uint16), "Little_endian must not add padding");
static_assert(sizeof(Little_endian<uint32>) == sizeof(uint32), "Little_endian must not add padding");
static_assert(sizeof(Little_endian<uint64>) == sizeof(uint64), "Little_endian must not add padding");
