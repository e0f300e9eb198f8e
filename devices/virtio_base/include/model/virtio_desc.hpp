/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

/*! \file Wire format of the entries of a descriptor table
 */

#include <model/virtio_common.hpp>
#include <platform/endian.hpp>
#include <platform/errno.hpp>
#include <platform/types.hpp>

namespace Virtio {
    // Entry of the descriptor table of a split virtqueue
    class SplitDescriptor;
    // Entry of the descriptor ring of a packed virtqueue
    class PackedDescriptor;
    // Driver/device event suppression structure of a packed virtqueue
    class PackedDescEvent;
    // Either of the two above. This is what the chain walker hands out.
    class Descriptor;
};

/*struct virtq_desc {
    le64 addr;  // Buffer guest physical address
    le32 len;   // Buffer length
    le16 flags; // Chained | write/read | indirect
    le16 next;  // Only valid if flags mark this descriptor as chained
};*/
class Virtio::SplitDescriptor {
public:
    SplitDescriptor() {}
    SplitDescriptor(uint64 addr, uint32 len, uint16 flags, uint16 next)
        : _addr(addr), _len(len), _flags(flags), _next(next) {}

    static constexpr size_t ENTRY_SIZE_BYTES = 16;
    static constexpr size_t region_size_bytes(uint16 num_entries) { return num_entries * ENTRY_SIZE_BYTES; }

    uint64 addr() const { return _addr.get(); }
    uint32 len() const { return _len.get(); }
    uint16 flags() const { return _flags.get(); }
    uint16 next() const { return _next.get(); }

    void set_addr(uint64 addr) { _addr.set(addr); }
    void set_len(uint32 len) { _len.set(len); }
    void set_flags(uint16 flags) { _flags.set(flags); }
    void set_next(uint16 next) { _next.set(next); }

    bool refers_to_indirect_table() const { return (flags() & VIRTQ_DESC_INDIRECT_LIST) != 0; }
    bool has_next() const { return (flags() & VIRTQ_DESC_CONT_NEXT) != 0; }
    bool is_write_only() const { return (flags() & VIRTQ_DESC_WRITE_ONLY) != 0; }

private:
    Little_endian<uint64> _addr;
    Little_endian<uint32> _len;
    Little_endian<uint16> _flags;
    Little_endian<uint16> _next;
};

/*struct pvirtq_desc {
    le64 addr;  // Buffer guest physical address
    le32 len;   // Buffer length
    le16 id;    // Buffer ID
    le16 flags; // Chained | write/read | indirect | avail | used
};*/
class Virtio::PackedDescriptor {
public:
    PackedDescriptor() {}
    PackedDescriptor(uint64 addr, uint32 len, uint16 id, uint16 flags)
        : _addr(addr), _len(len), _id(id), _flags(flags) {}

    static constexpr size_t ENTRY_SIZE_BYTES = 16;

    uint64 addr() const { return _addr.get(); }
    uint32 len() const { return _len.get(); }
    uint16 id() const { return _id.get(); }
    uint16 flags() const { return _flags.get(); }

    void set_addr(uint64 addr) { _addr.set(addr); }
    void set_len(uint32 len) { _len.set(len); }
    void set_id(uint16 id) { _id.set(id); }
    void set_flags(uint16 flags) { _flags.set(flags); }

    bool refers_to_indirect_table() const { return (flags() & VIRTQ_DESC_INDIRECT_LIST) != 0; }
    bool has_next() const { return (flags() & VIRTQ_DESC_CONT_NEXT) != 0; }
    bool is_write_only() const { return (flags() & VIRTQ_DESC_WRITE_ONLY) != 0; }

private:
    Little_endian<uint64> _addr;
    Little_endian<uint32> _len;
    Little_endian<uint16> _id;
    Little_endian<uint16> _flags;
};

/*struct pvirtq_event_suppress {
    le16 desc;  // Descriptor ring change event offset (bits 0-14) and wrap counter (bit 15)
    le16 flags; // Descriptor ring change event flags
};*/
class Virtio::PackedDescEvent {
public:
    PackedDescEvent() {}
    PackedDescEvent(uint16 off_wrap, uint16 flags) : _off_wrap(off_wrap), _flags(flags) {}

    uint16 off_wrap() const { return _off_wrap.get(); }
    uint16 flags() const { return _flags.get(); }

    uint16 offset() const { return off_wrap() & 0x7fff; }
    bool wrap_counter() const { return (off_wrap() >> 15) != 0; }

private:
    Little_endian<uint16> _off_wrap;
    Little_endian<uint16> _flags;
};

static_assert(sizeof(Virtio::SplitDescriptor) == Virtio::SplitDescriptor::ENTRY_SIZE_BYTES, "virtq_desc is 16 bytes");
static_assert(sizeof(Virtio::PackedDescriptor) == Virtio::PackedDescriptor::ENTRY_SIZE_BYTES,
              "pvirtq_desc is 16 bytes");
static_assert(sizeof(Virtio::PackedDescEvent) == 4, "pvirtq_event_suppress is 4 bytes");

class Virtio::Descriptor {
public:
    enum class Format : uint8 {
        SPLIT,
        PACKED,
    };

    Descriptor() : _format(Format::SPLIT), _split() {}
    explicit Descriptor(const Virtio::SplitDescriptor &d) : _format(Format::SPLIT), _split(d) {}
    explicit Descriptor(const Virtio::PackedDescriptor &d) : _format(Format::PACKED), _packed(d) {}

    Format format() const { return _format; }
    bool is_split() const { return _format == Format::SPLIT; }
    bool is_packed() const { return _format == Format::PACKED; }

    uint64 addr() const { return is_split() ? _split.addr() : _packed.addr(); }
    uint32 len() const { return is_split() ? _split.len() : _packed.len(); }
    uint16 flags() const { return is_split() ? _split.flags() : _packed.flags(); }

    bool refers_to_indirect_table() const { return (flags() & VIRTQ_DESC_INDIRECT_LIST) != 0; }
    bool has_next() const { return (flags() & VIRTQ_DESC_CONT_NEXT) != 0; }
    bool is_write_only() const { return (flags() & VIRTQ_DESC_WRITE_ONLY) != 0; }

    /*! \brief Index of the next descriptor of the chain
     *  \return NONE on success, NOTSUP for a packed descriptor since the packed ring
     *          does not link descriptors
     */
    Errno next(uint16 &idx) const {
        if (!is_split())
            return Errno::NOTSUP;
        idx = _split.next();
        return Errno::NONE;
    }

    /*! \brief Buffer ID of a packed descriptor
     *  \return NONE on success, NOTSUP for a split descriptor
     */
    Errno id(uint16 &buf_id) const {
        if (!is_packed())
            return Errno::NOTSUP;
        buf_id = _packed.id();
        return Errno::NONE;
    }

private:
    Format _format;
    union {
        Virtio::SplitDescriptor _split;
        Virtio::PackedDescriptor _packed;
    };
};
