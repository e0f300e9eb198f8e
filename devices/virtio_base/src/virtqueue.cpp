/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */

#include <arch/barrier.hpp>
#include <debug_switches.hpp>
#include <model/virtqueue.hpp>
#include <platform/bits.hpp>
#include <platform/compiler.hpp>
#include <platform/log.hpp>

Errno
Virtio::Queue::construct(uint16 max_size) {
    if (constructed()) {
        WARN("Queue already constructed with max size %u", _max_size);
        return Errno::PERM;
    }
    if (!is_size_valid(max_size)) {
        WARN("Invalid max queue size %u", max_size);
        return Errno::INVAL;
    }

    _max_size = max_size;
    reset();
    return Errno::NONE;
}

void
Virtio::Queue::reset() {
    _ready = false;
    _size = _max_size;
    _desc_table = GPA(DEFAULT_DESC_TABLE_ADDR);
    _avail_ring = GPA(DEFAULT_AVAIL_RING_ADDR);
    _used_ring = GPA(DEFAULT_USED_RING_ADDR);
    _next_avail = 0;
    _next_used = 0;
    _num_added = 0;
    _event_idx_enabled = false;
}

void
Virtio::Queue::set_size(uint16 size) {
    if (size > _max_size or !is_size_valid(size)) {
        WARN("Invalid queue size %u (max %u)", size, _max_size);
        return;
    }

    _size = size;
}

void
Virtio::Queue::set_ready(bool ready) {
    if (ready and !constructed()) {
        WARN("Cannot mark a queue ready before it is constructed");
        return;
    }

    _ready = ready;
}

void
Virtio::Queue::set_event_idx(bool enabled) {
    _event_idx_enabled = enabled;
}

void
Virtio::Queue::set_address(GPA &field, uint64 addr, uint64 align, const char *name) {
    if (!is_aligned(addr, align)) {
        WARN("Invalid %s address " FMTx64 ", must be aligned on " FMTu64 " bytes", name, addr, align);
        return;
    }

    field = GPA(addr);
}

void
Virtio::Queue::set_desc_table_address(uint32 low, uint32 high) {
    set_address(_desc_table, combine_low_high(low, high), DESC_TABLE_ALIGN, "descriptor table");
}

void
Virtio::Queue::set_desc_table_address_low(uint32 low) {
    set_desc_table_address(low, high32(_desc_table.value()));
}

void
Virtio::Queue::set_desc_table_address_high(uint32 high) {
    set_desc_table_address(low32(_desc_table.value()), high);
}

void
Virtio::Queue::set_avail_ring_address(uint32 low, uint32 high) {
    set_address(_avail_ring, combine_low_high(low, high), AVAIL_RING_ALIGN, "available ring");
}

void
Virtio::Queue::set_avail_ring_address_low(uint32 low) {
    set_avail_ring_address(low, high32(_avail_ring.value()));
}

void
Virtio::Queue::set_avail_ring_address_high(uint32 high) {
    set_avail_ring_address(low32(_avail_ring.value()), high);
}

void
Virtio::Queue::set_used_ring_address(uint32 low, uint32 high) {
    set_address(_used_ring, combine_low_high(low, high), USED_RING_ALIGN, "used ring");
}

void
Virtio::Queue::set_used_ring_address_low(uint32 low) {
    set_used_ring_address(low, high32(_used_ring.value()));
}

void
Virtio::Queue::set_used_ring_address_high(uint32 high) {
    set_used_ring_address(low32(_used_ring.value()), high);
}

bool
Virtio::Queue::is_valid(const Model::GuestMemory &mem) const {
    const size_t desc_table_size = SplitDescriptor::region_size_bytes(_size);
    const size_t avail_ring_size = Available::region_size_bytes(_size);
    const size_t used_ring_size = Used::region_size_bytes(_size);

    if (!_ready) {
        ERROR("Attempt to use a virtio queue that is not marked ready");
        return false;
    }
    if (!mem.is_gpa_valid(_desc_table, desc_table_size)) {
        ERROR("Descriptor table out of bounds: start " FMTx64 " size %zu", _desc_table.value(), desc_table_size);
        return false;
    }
    if (!mem.is_gpa_valid(_avail_ring, avail_ring_size)) {
        ERROR("Available ring out of bounds: start " FMTx64 " size %zu", _avail_ring.value(), avail_ring_size);
        return false;
    }
    if (!mem.is_gpa_valid(_used_ring, used_ring_size)) {
        ERROR("Used ring out of bounds: start " FMTx64 " size %zu", _used_ring.value(), used_ring_size);
        return false;
    }

    return true;
}

Errno
Virtio::Queue::avail_idx(const Model::GuestMemory &mem, Ordering o, uint16 &idx) const {
    GPA addr;

    if (!_ready)
        return Errno::PERM;

    TRY_ERRNO_LOG(_avail_ring.checked_add(Available::IDX_OFS, addr));
    return mem.load(addr, o, idx);
}

Errno
Virtio::Queue::used_idx(const Model::GuestMemory &mem, Ordering o, uint16 &idx) const {
    GPA addr;

    if (!_ready)
        return Errno::PERM;

    TRY_ERRNO_LOG(_used_ring.checked_add(Used::IDX_OFS, addr));
    return mem.load(addr, o, idx);
}

Errno
Virtio::Queue::used_event(const Model::GuestMemory &mem, Ordering o, uint16 &event) const {
    GPA addr;

    if (!_ready)
        return Errno::PERM;

    TRY_ERRNO_LOG(_avail_ring.checked_add(Available::used_event_ofs(_size), addr));
    return mem.load(addr, o, event);
}

Errno
Virtio::Queue::add_used(const Model::GuestMemory &mem, uint16 head, uint32 len) {
    GPA elem_addr, idx_addr;

    if (!_ready)
        return Errno::PERM;

    if (head >= _size) {
        WARN("Attempt to return an out of range descriptor %u (size %u)", head, _size);
        return Errno::RANGE;
    }

    TRY_ERRNO_LOG(_used_ring.checked_add(Used::ring_entry_ofs(_next_used % _size), elem_addr));
    TRY_ERRNO_LOG(_used_ring.checked_add(Used::IDX_OFS, idx_addr));
    TRY_ERRNO_LOG(mem.write_obj(elem_addr, UsedElement(head, len)));

    _next_used++;
    _num_added++;

    if (Debug::trace_virtqueue())
        DEBUG("Used ring: head %u len %u, publishing idx %u", head, len, _next_used);

    // NOTE: the element must be visible to the driver before the new index.
    return mem.store(idx_addr, _next_used, Ordering::RELEASE);
}

Errno
Virtio::Queue::set_notification(const Model::GuestMemory &mem, bool enable) {
    GPA addr;

    if (!_ready)
        return Errno::PERM;

    if (_event_idx_enabled) {
        // Notifications stop by themselves after one has been sent when event idx
        // is negotiated, there is nothing to disable.
        if (!enable)
            return Errno::NONE;

        // NOTE: we publish [next_avail], not the current avail idx, so that entries
        // published while we were processing still cause a notification.
        TRY_ERRNO_LOG(_used_ring.checked_add(Used::avail_event_ofs(_size), addr));
        return mem.store(addr, _next_avail, Ordering::RELAXED);
    }

    TRY_ERRNO_LOG(_used_ring.checked_add(Used::FLAGS_OFS, addr));
    return mem.store(addr, static_cast<uint16>(enable ? 0 : VIRTQ_USED_NO_NOTIFY), Ordering::RELAXED);
}

Errno
Virtio::Queue::enable_notification(const Model::GuestMemory &mem, bool &pending) {
    uint16 idx;

    TRY_ERRNO_LOG(set_notification(mem, true));

    // The driver may have published new entries right before we re-armed the
    // notification. The re-read of avail idx must not move before the store above.
    Barrier::rw_before_rw();

    TRY_ERRNO_LOG(avail_idx(mem, Ordering::RELAXED, idx));

    // NOTE: an index that went backwards is not pending work. iter would not
    // produce anything for it and the caller would spin forever.
    uint16 count = Ring::available_count(idx, _next_avail);
    pending = (count != 0 and count <= _size);
    return Errno::NONE;
}

Errno
Virtio::Queue::disable_notification(const Model::GuestMemory &mem) {
    return set_notification(mem, false);
}

Errno
Virtio::Queue::needs_notification(const Model::GuestMemory &mem, bool &needed) {
    uint16 event;

    if (!_ready)
        return Errno::PERM;

    if (!_event_idx_enabled) {
        needed = true;
        return Errno::NONE;
    }

    // All the used ring updates from add_used must be visible before we read the event.
    Barrier::rw_before_rw();

    TRY_ERRNO_LOG(used_event(mem, Ordering::RELAXED, event));

    uint16 old = static_cast<uint16>(_next_used - _num_added);
    _num_added = 0;

    needed = Ring::vring_need_event(event, _next_used, old);
    return Errno::NONE;
}

Errno
Virtio::Queue::iter(const Model::GuestMemory &mem, Virtio::AvailIter &it) {
    uint16 idx;

    TRY_ERRNO_LOG(avail_idx(mem, Ordering::ACQUIRE, idx));

    if (Ring::available_count(idx, _next_avail) > _size) {
        // The driver moved its index backwards (or by more than a full ring).
        // Nothing published since our last pass can be trusted.
        WARN("Invalid available ring index %u (next avail %u, size %u)", idx, _next_avail, _size);
        it = Virtio::AvailIter(mem, *this, _next_avail);
        return Errno::NONE;
    }

    it = Virtio::AvailIter(mem, *this, idx);
    return Errno::NONE;
}

Errno
Virtio::Queue::pop_descriptor_chain(const Model::GuestMemory &mem, Virtio::DescriptorChain &chain) {
    Virtio::AvailIter it;

    TRY_ERRNO_LOG(iter(mem, it));
    return it.next(chain);
}

Virtio::QueueState
Virtio::Queue::state() const {
    Virtio::QueueState s;

    s.max_size = _max_size;
    s.size = _size;
    s.ready = _ready;
    s.desc_table = _desc_table.value();
    s.avail_ring = _avail_ring.value();
    s.used_ring = _used_ring.value();
    s.next_avail = _next_avail;
    s.next_used = _next_used;
    s.event_idx_enabled = _event_idx_enabled;

    return s;
}

Errno
Virtio::Queue::restore(const Virtio::QueueState &s) {
    if (!constructed() or s.max_size != _max_size) {
        WARN("Cannot restore a queue state with max size %u into a queue with max size %u", s.max_size, _max_size);
        return Errno::INVAL;
    }
    if (s.size > _max_size or !is_size_valid(s.size)) {
        WARN("Cannot restore a queue state with size %u", s.size);
        return Errno::INVAL;
    }
    if (!is_aligned(s.desc_table, DESC_TABLE_ALIGN) or !is_aligned(s.avail_ring, AVAIL_RING_ALIGN)
        or !is_aligned(s.used_ring, USED_RING_ALIGN)) {
        WARN("Cannot restore a queue state with misaligned rings");
        return Errno::INVAL;
    }

    _size = s.size;
    _ready = s.ready;
    _desc_table = GPA(s.desc_table);
    _avail_ring = GPA(s.avail_ring);
    _used_ring = GPA(s.used_ring);
    _next_avail = s.next_avail;
    _next_used = s.next_used;
    _num_added = 0;
    _event_idx_enabled = s.event_idx_enabled;

    return Errno::NONE;
}

uint16
Virtio::AvailIter::remaining() const {
    if (_queue == nullptr)
        return 0;

    return Ring::available_count(_last_index, _queue->_next_avail);
}

Errno
Virtio::AvailIter::next(Virtio::DescriptorChain &chain) {
    GPA addr;
    uint16 head;

    if (_queue == nullptr or _queue->_next_avail == _last_index)
        return Errno::NOENT;

    const Virtio::Queue &q = *_queue;

    TRY_ERRNO_LOG(q._avail_ring.checked_add(Available::ring_entry_ofs(q._next_avail % q._size), addr));
    TRY_ERRNO_LOG(_mem->load(addr, Ordering::ACQUIRE, head));

    _queue->_next_avail++;

    if (Debug::trace_virtqueue())
        DEBUG("Available ring: head %u, next avail %u", head, _queue->_next_avail);

    chain = Virtio::DescriptorChain(*_mem, q._desc_table, q._size, head);
    return Errno::NONE;
}
