/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

/*! \file Layout of the available and used rings of a split virtqueue
 */

#include <platform/endian.hpp>
#include <platform/types.hpp>

namespace Virtio {
    class Available;
    class Used;
    class UsedElement;

    namespace Ring {
        /*! \brief Number of ring entries published by the driver and not consumed yet
         *
         * Both indices are free-running 16-bit counters. A result larger than the
         * queue size means the driver moved its index backwards.
         */
        inline uint16 available_count(uint16 avail_idx, uint16 next_avail) {
            return static_cast<uint16>(avail_idx - next_avail);
        }

        /*! \brief Did the used index cross [event] while moving from [old_idx] to [new_idx]?
         */
        inline bool vring_need_event(uint16 event, uint16 new_idx, uint16 old_idx) {
            return static_cast<uint16>(new_idx - event - 1) < static_cast<uint16>(new_idx - old_idx);
        }
    };
};

// Guest (Driver) writes and host (Device) reads from Virtio::Available
/*struct virtq_avail {
    le16 flags;
    le16 idx;
    le16 ring[size];
    le16 used_event; // Only if VIRTIO_F_EVENT_IDX
};*/
class Virtio::Available {
public:
    static constexpr size_t FLAGS_OFS = 0;
    static constexpr size_t IDX_OFS = FLAGS_OFS + sizeof(uint16);
    static constexpr size_t RING_OFS = IDX_OFS + sizeof(uint16);
    static constexpr size_t ELEMENT_SIZE_BYTES = sizeof(uint16);

    static constexpr size_t ring_entry_ofs(uint16 slot) { return RING_OFS + slot * ELEMENT_SIZE_BYTES; }
    static constexpr size_t used_event_ofs(uint16 num_entries) { return ring_entry_ofs(num_entries); }
    static constexpr size_t region_size_bytes(uint16 num_entries) {
        return used_event_ofs(num_entries) + sizeof(uint16);
    }
};

/*struct virtq_used_elem {
    le32 id;  // Index of start of used descriptor chain
    le32 len; // Bytes written into the device-writable part of the chain
};*/
class Virtio::UsedElement {
public:
    UsedElement() {}
    UsedElement(uint32 id, uint32 len) : _id(id), _len(len) {}

    static constexpr size_t ENTRY_SIZE_BYTES = 8;

    uint32 id() const { return _id.get(); }
    uint32 len() const { return _len.get(); }

private:
    Little_endian<uint32> _id;
    Little_endian<uint32> _len;
};

static_assert(sizeof(Virtio::UsedElement) == Virtio::UsedElement::ENTRY_SIZE_BYTES, "virtq_used_elem is 8 bytes");

// Host (Device) writes and guest (Driver) reads from Virtio::Used
/*struct virtq_used {
    le16 flags;
    le16 idx;
    struct virtq_used_elem ring[size];
    le16 avail_event; // Only if VIRTIO_F_EVENT_IDX
};*/
class Virtio::Used {
public:
    static constexpr size_t FLAGS_OFS = 0;
    static constexpr size_t IDX_OFS = FLAGS_OFS + sizeof(uint16);
    static constexpr size_t RING_OFS = IDX_OFS + sizeof(uint16);
    static constexpr size_t ELEMENT_SIZE_BYTES = UsedElement::ENTRY_SIZE_BYTES;

    static constexpr size_t ring_entry_ofs(uint16 slot) { return RING_OFS + slot * ELEMENT_SIZE_BYTES; }
    static constexpr size_t avail_event_ofs(uint16 num_entries) { return ring_entry_ofs(num_entries); }
    static constexpr size_t region_size_bytes(uint16 num_entries) {
        return avail_event_ofs(num_entries) + sizeof(uint16);
    }
};
