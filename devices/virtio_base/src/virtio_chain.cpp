/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */

#include <debug_switches.hpp>
#include <model/virtio_chain.hpp>
#include <platform/compiler.hpp>
#include <platform/log.hpp>

Errno
Virtio::DescriptorChain::switch_to_indirect_table(const Virtio::SplitDescriptor &desc) {
    // "The driver MUST NOT set the VIRTQ_DESC_F_INDIRECT flag within an indirect
    // descriptor" and "MUST NOT set both VIRTQ_DESC_F_INDIRECT and VIRTQ_DESC_F_NEXT".
    // cf. 2.7.5.3.1
    if (_is_indirect) {
        WARN("Chain %u: nested indirect table", _head_index);
        return fail(Errno::NOTRECOVERABLE);
    }
    if (desc.has_next()) {
        WARN("Chain %u: indirect descriptor is chained", _head_index);
        return fail(Errno::NOTRECOVERABLE);
    }

    uint32 len = desc.len();
    if (len == 0 or (len % SplitDescriptor::ENTRY_SIZE_BYTES) != 0
        or (len / SplitDescriptor::ENTRY_SIZE_BYTES) > MAX_INDIRECT_ENTRIES) {
        WARN("Chain %u: invalid indirect table length %u", _head_index, len);
        return fail(Errno::NOTRECOVERABLE);
    }

    _desc_table = GPA(desc.addr());
    _queue_size = static_cast<uint16>(len / SplitDescriptor::ENTRY_SIZE_BYTES);
    _ttl = _queue_size;
    _next_index = 0;
    _has_next = true;
    _is_indirect = true;

    return Errno::NONE;
}

Errno
Virtio::DescriptorChain::next(Virtio::Descriptor &desc) {
    if (_err != Errno::NONE)
        return _err;
    if (!_has_next or _mem == nullptr)
        return Errno::NOENT;

    if (_ttl == 0) {
        WARN("Chain %u: longer than its table, the chain loops", _head_index);
        return fail(Errno::NOTRECOVERABLE);
    }
    if (_next_index >= _queue_size) {
        WARN("Chain %u: descriptor index %u out of range (size %u)", _head_index, _next_index, _queue_size);
        return fail(Errno::RANGE);
    }

    GPA addr;
    Errno err = _desc_table.checked_add(SplitDescriptor::region_size_bytes(_next_index), addr);
    if (err != Errno::NONE)
        return fail(err);

    Virtio::SplitDescriptor split;
    err = _mem->read_obj(addr, split);
    if (__UNLIKELY__(err != Errno::NONE)) {
        WARN("Chain %u: unable to read descriptor at " FMTx64 ": %s", _head_index, addr.value(), errno2str(err));
        return fail(err);
    }

    if (split.refers_to_indirect_table()) {
        err = switch_to_indirect_table(split);
        if (err != Errno::NONE)
            return err;

        // NOTE: the indirect descriptor itself is not part of the request, hand out
        // the first entry of the table instead.
        return next(desc);
    }

    _ttl--;
    _has_next = split.has_next();
    _next_index = split.next();
    desc = Virtio::Descriptor(split);

    if (Debug::trace_virtqueue()) {
        DEBUG("Chain %u: addr " FMTx64 " len %u flags 0x%x next %u%s", _head_index, split.addr(), split.len(),
              split.flags(), split.next(), _is_indirect ? " (indirect)" : "");
    }

    return Errno::NONE;
}

Errno
Virtio::DescriptorChain::next_readable(Virtio::Descriptor &desc) {
    Virtio::Descriptor tmp;
    Errno err;

    while ((err = next(tmp)) == Errno::NONE) {
        if (!tmp.is_write_only()) {
            desc = tmp;
            return Errno::NONE;
        }
    }

    return err;
}

Errno
Virtio::DescriptorChain::next_writable(Virtio::Descriptor &desc) {
    Virtio::Descriptor tmp;
    Errno err;

    while ((err = next(tmp)) == Errno::NONE) {
        if (tmp.is_write_only()) {
            desc = tmp;
            return Errno::NONE;
        }
    }

    return err;
}
