/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */
#pragma once

#include <model/guest_memory.hpp>
#include <model/virtio_chain.hpp>
#include <model/virtio_common.hpp>
#include <model/virtio_desc.hpp>
#include <model/virtio_ring.hpp>
#include <platform/atomic.hpp>
#include <platform/bits.hpp>
#include <platform/errno.hpp>
#include <platform/types.hpp>

namespace Virtio {
    // [Virtio::Queue] is the device side of a split virtqueue. It owns the
    // configuration written by the driver through the transport and the two
    // cursors (next_avail/next_used) that only the device moves.
    class Queue;

    // Bounded walk over the heads published in the available ring, created
    // by [Virtio::Queue::iter].
    class AvailIter;

    // Plain copy of every field of a [Virtio::Queue], for save/restore.
    struct QueueState;
};

struct Virtio::QueueState {
    uint16 max_size{0};
    uint16 size{0};
    bool ready{false};
    uint64 desc_table{DEFAULT_DESC_TABLE_ADDR};
    uint64 avail_ring{DEFAULT_AVAIL_RING_ADDR};
    uint64 used_ring{DEFAULT_USED_RING_ADDR};
    uint16 next_avail{0};
    uint16 next_used{0};
    bool event_idx_enabled{false};
};

class Virtio::AvailIter {
    friend Virtio::Queue;

public:
    AvailIter() : _mem(nullptr), _queue(nullptr), _last_index(0) {}

    /*! \brief Produce the chain of the next available head
     *  \param chain receives the chain, untouched unless NONE is returned
     *  \return NONE if a chain was produced, NOENT once every entry published when
     *          the iterator was created has been consumed. Other errors come from
     *          reading the available ring, the cursor is not moved in that case.
     */
    Errno next(Virtio::DescriptorChain &chain);

    /*! \brief Number of heads this iterator can still produce */
    uint16 remaining() const;

private:
    AvailIter(const Model::GuestMemory &mem, Virtio::Queue &queue, uint16 last_index)
        : _mem(&mem), _queue(&queue), _last_index(last_index) {}

    const Model::GuestMemory *_mem;
    Virtio::Queue *_queue;
    uint16 _last_index; // avail_idx observed when the iterator was created
};

/*! \brief Device side of a split virtqueue
 *
 * Typical use from a device model, once the queue is ready and valid:
 * | bool more;
 * | do {
 * |     vq.disable_notification(mem);
 * |     Virtio::AvailIter it;
 * |     vq.iter(mem, it);
 * |     Virtio::DescriptorChain chain;
 * |     while (it.next(chain) == Errno::NONE) {
 * |         // process, then
 * |         vq.add_used(mem, chain.head_index(), written);
 * |     }
 * |     vq.enable_notification(mem, more);
 * | } while (more);
 * | bool notify;
 * | if (vq.needs_notification(mem, notify) == Errno::NONE && notify)
 * |     // inject the interrupt
 *
 * All the operations that touch the rings return PERM while the queue is not ready.
 */
class Virtio::Queue {
    friend Virtio::AvailIter;

public:
    Queue() {}

    // The cursors belong to a single consumer. Copying a queue would fork them.
    Queue(const Queue &) = delete;
    Queue &operator=(const Queue &) = delete;

    /*! \brief Give the queue its maximum size and put it in its reset state
     *  \param max_size largest size the device supports, a power of two no larger
     *         than MAX_QUEUE_SIZE
     *  \return NONE on success, INVAL for an invalid max_size, PERM if the queue was
     *          already constructed
     */
    Errno construct(uint16 max_size);

    static bool is_size_valid(uint16 size) { return size <= MAX_QUEUE_SIZE and is_pow2(size); }

    /*! \brief Restore every default except max_size */
    void reset();

    uint16 max_size() const { return _max_size; }
    uint16 size() const { return _size; }
    bool ready() const { return _ready; }
    bool event_idx_enabled() const { return _event_idx_enabled; }
    GPA desc_table() const { return _desc_table; }
    GPA avail_ring() const { return _avail_ring; }
    GPA used_ring() const { return _used_ring; }

    // Configuration, as written by the driver. Invalid values are logged and ignored.
    void set_size(uint16 size);
    void set_ready(bool ready);
    void set_event_idx(bool enabled);
    void set_features(uint64 features) { set_event_idx((features & VIRTIO_F_EVENT_IDX) != 0); }

    void set_desc_table_address(uint32 low, uint32 high);
    void set_desc_table_address_low(uint32 low);
    void set_desc_table_address_high(uint32 high);
    void set_avail_ring_address(uint32 low, uint32 high);
    void set_avail_ring_address_low(uint32 low);
    void set_avail_ring_address_high(uint32 high);
    void set_used_ring_address(uint32 low, uint32 high);
    void set_used_ring_address_low(uint32 low);
    void set_used_ring_address_high(uint32 high);

    /*! \brief Can the device start using this queue?
     *  \return true if the queue is ready and the descriptor table, available ring
     *          and used ring are entirely backed by [mem]
     */
    bool is_valid(const Model::GuestMemory &mem) const;

    /*! \brief Read the idx field of the available ring */
    Errno avail_idx(const Model::GuestMemory &mem, Ordering o, uint16 &idx) const;
    /*! \brief Read the idx field of the used ring */
    Errno used_idx(const Model::GuestMemory &mem, Ordering o, uint16 &idx) const;
    /*! \brief Read the used_event field that trails the available ring */
    Errno used_event(const Model::GuestMemory &mem, Ordering o, uint16 &event) const;

    /*! \brief Return a chain to the driver
     *  \param head index of the first descriptor of the chain
     *  \param len number of bytes written into the chain by the device
     *  \return NONE on success, RANGE if [head] is not a valid descriptor index (the
     *          queue is left untouched), ADDR_OVERFLOW or a memory error otherwise
     */
    Errno add_used(const Model::GuestMemory &mem, uint16 head, uint32 len);

    /*! \brief Ask the driver to notify us about new buffers
     *  \param pending set to true if the driver published buffers that were not
     *         consumed yet. The caller should then go for another pass.
     */
    Errno enable_notification(const Model::GuestMemory &mem, bool &pending);

    /*! \brief Ask the driver to stop notifying us. This is a no-op with event idx. */
    Errno disable_notification(const Model::GuestMemory &mem);

    /*! \brief Should the driver be interrupted for the buffers added since the last call?
     *  \param needed always true without event idx
     */
    Errno needs_notification(const Model::GuestMemory &mem, bool &needed);

    /*! \brief Start a pass over the available ring
     *  \param it receives an iterator over the heads published so far
     */
    Errno iter(const Model::GuestMemory &mem, Virtio::AvailIter &it);

    /*! \brief Consume a single available chain
     *  \return NONE if a chain was produced, NOENT if there is none
     */
    Errno pop_descriptor_chain(const Model::GuestMemory &mem, Virtio::DescriptorChain &chain);

    /*! \brief Give back the last consumed head, it will be produced again */
    void go_to_previous_position() { _next_avail--; }

    uint16 next_avail() const { return _next_avail; }
    void set_next_avail(uint16 next_avail) { _next_avail = next_avail; }
    uint16 next_used() const { return _next_used; }
    uint16 num_added() const { return _num_added; }
    void set_next_used(uint16 next_used) { _next_used = next_used; }

    Virtio::QueueState state() const;

    /*! \brief Load a previously saved state
     *  \return NONE on success, INVAL if [s] breaks an invariant of the queue. The
     *          queue is left untouched in that case.
     */
    Errno restore(const Virtio::QueueState &s);

private:
    bool constructed() const { return _max_size != 0; }

    void set_address(GPA &field, uint64 addr, uint64 align, const char *name);
    Errno set_notification(const Model::GuestMemory &mem, bool enable);

    uint16 _max_size{0};
    uint16 _size{0};
    bool _ready{false};
    GPA _desc_table{DEFAULT_DESC_TABLE_ADDR};
    GPA _avail_ring{DEFAULT_AVAIL_RING_ADDR};
    GPA _used_ring{DEFAULT_USED_RING_ADDR};
    uint16 _next_avail{0};
    uint16 _next_used{0};
    uint16 _num_added{0}; // chains added to the used ring since the last needs_notification
    bool _event_idx_enabled{false};
};
