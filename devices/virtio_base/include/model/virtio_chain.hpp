/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

#include <model/guest_memory.hpp>
#include <model/virtio_desc.hpp>
#include <platform/errno.hpp>
#include <platform/types.hpp>

namespace Virtio {
    class DescriptorChain;
};

/*! \brief Lazy walk over the descriptors of one request
 *
 * A chain only remembers where it is in the descriptor table. Every descriptor
 * is read from guest memory when it is handed out, nothing is cached, so a
 * chain is cheap to copy and never outlives the guest memory it points to.
 *
 * The walk follows [next] links while VIRTQ_DESC_CONT_NEXT is set and enters
 * an indirect table when a descriptor has VIRTQ_DESC_INDIRECT_LIST. It is
 * bounded by the size of the current table, so a looping chain terminates.
 */
class Virtio::DescriptorChain {
public:
    static constexpr uint32 MAX_INDIRECT_ENTRIES = UINT16_MAX;

    /*! \brief Empty chain. It yields nothing. */
    DescriptorChain()
        : _mem(nullptr), _desc_table(0), _queue_size(0), _head_index(0), _next_index(0), _ttl(0), _has_next(false),
          _is_indirect(false), _err(Errno::NONE) {}

    /*! \brief Chain starting at [head_index] in the table at [desc_table]
     *  \pre [mem] outlives the chain
     */
    DescriptorChain(const Model::GuestMemory &mem, GPA desc_table, uint16 queue_size, uint16 head_index)
        : _mem(&mem), _desc_table(desc_table), _queue_size(queue_size), _head_index(head_index),
          _next_index(head_index), _ttl(queue_size), _has_next(true), _is_indirect(false), _err(Errno::NONE) {}

    /*! \brief Produce the next descriptor of the chain
     *  \param desc receives the descriptor, untouched unless NONE is returned
     *  \return NONE if a descriptor was produced, NOENT once the chain is over.
     *          Any other value means the chain is malformed or unreachable: RANGE for
     *          an index outside of the table, ADDR_OVERFLOW when a table address wraps,
     *          FAULT when guest memory cannot be read and NOTRECOVERABLE for a chain
     *          that is too long or an invalid indirect table. Such an error is sticky.
     */
    Errno next(Virtio::Descriptor &desc);

    /*! \brief Same as [next] but skip the device-writable descriptors */
    Errno next_readable(Virtio::Descriptor &desc);

    /*! \brief Same as [next] but skip the device-readable descriptors */
    Errno next_writable(Virtio::Descriptor &desc);

    uint16 head_index() const { return _head_index; }
    const Model::GuestMemory *memory() const { return _mem; }

    /*! \brief Is the walk currently inside an indirect table? */
    bool is_indirect() const { return _is_indirect; }

    /*! \brief Error that terminated the walk, NONE if the walk is fine so far */
    Errno error() const { return _err; }

private:
    Errno fail(Errno err) {
        _err = err;
        _has_next = false;
        return err;
    }

    Errno switch_to_indirect_table(const Virtio::SplitDescriptor &desc);

    const Model::GuestMemory *_mem;
    GPA _desc_table;
    uint16 _queue_size; // number of entries of the current table
    uint16 _head_index;
    uint16 _next_index;
    uint16 _ttl; // descriptors left before we call the chain a loop
    bool _has_next;
    bool _is_indirect;
    Errno _err;
};
