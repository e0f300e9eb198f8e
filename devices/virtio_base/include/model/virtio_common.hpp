/**
 * Copyright (C) 2021-2024 BlueRock Security, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BlueRock Open-Source License.
 * See the LICENSE-BlueRock file in the repository root for details.
 */

#pragma once

#include <platform/types.hpp>

namespace Virtio {
    enum FeatureBits : uint64;

    /*! \brief Largest queue size allowed for a split virtqueue */
    static constexpr uint16 MAX_QUEUE_SIZE = 32768;

    static constexpr uint64 DEFAULT_DESC_TABLE_ADDR = 0x0;
    static constexpr uint64 DEFAULT_AVAIL_RING_ADDR = 0x0;
    static constexpr uint64 DEFAULT_USED_RING_ADDR = 0x0;

    static constexpr uint64 DESC_TABLE_ALIGN = 16;
    static constexpr uint64 AVAIL_RING_ALIGN = 2;
    static constexpr uint64 USED_RING_ALIGN = 4;
};

// These are device-independent feature bits as per VirtIO specs section [6 Reserved Feature Bits]
enum Virtio::FeatureBits : uint64 {
    VIRTIO_F_INDIRECT_DESC = 1ULL << 28,
    VIRTIO_F_EVENT_IDX = 1ULL << 29,
    VIRTIO_F_VERSION_1 = 1ULL << 32,
    VIRTIO_F_ACCESS_PLATFORM = 1ULL << 33,
    VIRTIO_F_RING_PACKED = 1ULL << 34,
    VIRTIO_F_IN_ORDER = 1ULL << 35,
};

enum VirtqDesc : uint16 {
    VIRTQ_DESC_CONT_NEXT = 0x1,
    VIRTQ_DESC_WRITE_ONLY = 0x2,
    VIRTQ_DESC_INDIRECT_LIST = 0x4,
    // Packed ring only
    VIRTQ_DESC_AVAIL = 1 << 7,
    VIRTQ_DESC_USED = 1 << 15,
};

enum VirtqUsed : uint16 {
    VIRTQ_USED_NO_NOTIFY = 0x1,
};

// Flags of a packed ring event suppression structure
enum VirtqPackedEvent : uint16 {
    VIRTQ_PACKED_EVENT_ENABLE = 0x0,
    VIRTQ_PACKED_EVENT_DISABLE = 0x1,
    VIRTQ_PACKED_EVENT_DESC = 0x2,
};
