/**
 * Copyright (C) 2020-2024 BlueRock Security, Inc.
 * All rights reserved.
 *
 * This software is distributed under the terms of the BlueRock Open-Source License.
 * See the LICENSE-BlueRock file in the repository root for details.
 */

#include <cctype>
#include <cstring>
#include <debug_switches.hpp>
#include <model/guest_as.hpp>
#include <model/virtqueue.hpp>
#include <platform/log.hpp>
#include <platform/types.hpp>

static const constexpr uint32 VIRTIO_RAM_SIZE = 0x10000;
static const uint64 VIRTIO_GUEST_BASE = 0x10000000;

static const uint64 Q0_DESC = VIRTIO_GUEST_BASE;
static const uint64 Q0_DRIVER = VIRTIO_GUEST_BASE + 0x1000;
static const uint64 Q0_DEVICE = VIRTIO_GUEST_BASE + 0x2000;
static const uint64 Q0_INDIRECT = VIRTIO_GUEST_BASE + 0x3000;
static const uint64 Q0_BUFFERS = VIRTIO_GUEST_BASE + 0x4000;
static const uint64 BUFFER_SIZE = 0x100;

static const uint16 QUEUE_SIZE = 16;

static const char *const MESSAGES[] = {"hello", "virtio", "split ring"};

/*! \brief The driver half of the example: puts requests in the rings
 *
 * Request i uses descriptors (2i, 2i + 1): a device-readable buffer holding the
 * message, followed by a device-writable buffer that receives the reply. The
 * last request goes through an indirect table instead.
 */
class Dummy_driver {
public:
    explicit Dummy_driver(const Model::GuestMemory &mem) : _mem(mem) {}

    Errno publish(uint16 req, bool indirect) {
        uint64 in_buf = Q0_BUFFERS + (2 * req) * BUFFER_SIZE;
        uint64 out_buf = in_buf + BUFFER_SIZE;
        uint32 len = static_cast<uint32>(strlen(MESSAGES[req]));
        uint16 head = static_cast<uint16>(2 * req);

        TRY_ERRNO_ERR(_mem.write(GPA(in_buf), len, MESSAGES[req]));

        Virtio::SplitDescriptor in(in_buf, len, VIRTQ_DESC_CONT_NEXT, 1);
        Virtio::SplitDescriptor out(out_buf, BUFFER_SIZE, VIRTQ_DESC_WRITE_ONLY, 0);

        if (indirect) {
            TRY_ERRNO_ERR(_mem.write_obj(GPA(Q0_INDIRECT), in));
            TRY_ERRNO_ERR(_mem.write_obj(GPA(Q0_INDIRECT + sizeof(in)), out));
            TRY_ERRNO_ERR(write_desc(head, Virtio::SplitDescriptor(Q0_INDIRECT, 2 * sizeof(in),
                                                                   VIRTQ_DESC_INDIRECT_LIST, 0)));
        } else {
            in.set_next(static_cast<uint16>(head + 1));
            TRY_ERRNO_ERR(write_desc(head, in));
            TRY_ERRNO_ERR(write_desc(static_cast<uint16>(head + 1), out));
        }

        TRY_ERRNO_ERR(_mem.store<uint16>(GPA(Q0_DRIVER + Virtio::Available::ring_entry_ofs(_avail_idx % QUEUE_SIZE)),
                                         head, Ordering::RELAXED));
        _avail_idx++;
        return _mem.store(GPA(Q0_DRIVER + Virtio::Available::IDX_OFS), _avail_idx, Ordering::RELEASE);
    }

    Errno print_used() const {
        uint16 used_idx;

        TRY_ERRNO_ERR(_mem.load(GPA(Q0_DEVICE + Virtio::Used::IDX_OFS), Ordering::ACQUIRE, used_idx));
        for (uint16 i = 0; i < used_idx; i++) {
            Virtio::UsedElement e;
            char reply[BUFFER_SIZE + 1] = {};

            TRY_ERRNO_ERR(_mem.read_obj(GPA(Q0_DEVICE + Virtio::Used::ring_entry_ofs(i % QUEUE_SIZE)), e));
            uint64 out_buf = Q0_BUFFERS + (e.id() + 1) * BUFFER_SIZE;
            TRY_ERRNO_ERR(_mem.read(reply, e.len() < BUFFER_SIZE ? e.len() : BUFFER_SIZE, GPA(out_buf)));
            INFO("Driver: request %u completed with %u bytes: '%s'", e.id(), e.len(), reply);
        }

        return Errno::NONE;
    }

private:
    Errno write_desc(uint16 idx, const Virtio::SplitDescriptor &d) {
        return _mem.write_obj(GPA(Q0_DESC + Virtio::SplitDescriptor::region_size_bytes(idx)), d);
    }

    const Model::GuestMemory &_mem;
    uint16 _avail_idx{0};
};

/*! \brief Device logic: upper-case the readable part into the writable part
 */
static Errno
process_chain(const Model::GuestMemory &mem, Virtio::DescriptorChain &chain, uint32 &written) {
    char data[BUFFER_SIZE];
    size_t size = 0;
    Virtio::Descriptor desc;
    Errno err;

    written = 0;

    // Chains are read lazily from guest memory, a copy walks the same descriptors again.
    Virtio::DescriptorChain writer = chain;

    while ((err = chain.next_readable(desc)) == Errno::NONE) {
        size_t len = desc.len();
        if (len > sizeof(data) - size)
            len = sizeof(data) - size;
        TRY_ERRNO_ERR(mem.read(data + size, len, GPA(desc.addr())));
        size += len;
    }
    if (err != Errno::NOENT)
        return err;

    for (size_t i = 0; i < size; i++)
        data[i] = static_cast<char>(toupper(static_cast<unsigned char>(data[i])));

    while ((err = writer.next_writable(desc)) == Errno::NONE) {
        uint32 len = desc.len() < size - written ? desc.len() : static_cast<uint32>(size - written);
        TRY_ERRNO_ERR(mem.write(GPA(desc.addr()), len, data + written));
        written += len;
    }

    return err == Errno::NOENT ? Errno::NONE : err;
}

static Errno
run_device(const Model::GuestMemory &mem, Virtio::Queue &vq) {
    bool more = false;

    do {
        Virtio::AvailIter it;
        Virtio::DescriptorChain chain;

        TRY_ERRNO_ERR(vq.disable_notification(mem));
        TRY_ERRNO_ERR(vq.iter(mem, it));

        while (it.next(chain) == Errno::NONE) {
            uint32 written = 0;
            Errno err = process_chain(mem, chain, written);
            if (err != Errno::NONE)
                WARN("Device: dropping malformed request %u: %s", chain.head_index(), errno2str(err));

            TRY_ERRNO_ERR(vq.add_used(mem, chain.head_index(), written));
        }

        TRY_ERRNO_ERR(vq.enable_notification(mem, more));
    } while (more);

    bool notify = false;
    TRY_ERRNO_ERR(vq.needs_notification(mem, notify));
    INFO("Device: %s the driver", notify ? "interrupting" : "not interrupting");

    return Errno::NONE;
}

static Errno
run(Model::GuestAS &gas) {
    Virtio::Queue vq;

    TRY_ERRNO_ERR(gas.add_region(GPA(VIRTIO_GUEST_BASE), VIRTIO_RAM_SIZE));

    // What the transport does on behalf of the driver
    TRY_ERRNO_ERR(vq.construct(QUEUE_SIZE));
    vq.set_features(Virtio::VIRTIO_F_VERSION_1 | Virtio::VIRTIO_F_INDIRECT_DESC);
    vq.set_desc_table_address(low32(Q0_DESC), high32(Q0_DESC));
    vq.set_avail_ring_address(low32(Q0_DRIVER), high32(Q0_DRIVER));
    vq.set_used_ring_address(low32(Q0_DEVICE), high32(Q0_DEVICE));
    vq.set_ready(true);

    if (!vq.is_valid(gas)) {
        ERROR("Queue configuration rejected");
        return Errno::INVAL;
    }

    Dummy_driver driver(gas);
    const uint16 num_requests = static_cast<uint16>(ARRAY_LENGTH(MESSAGES));

    for (uint16 i = 0; i < num_requests; i++)
        TRY_ERRNO_ERR(driver.publish(i, i == num_requests - 1));

    INFO("Driver: %u requests published, kicking the device", num_requests);
    TRY_ERRNO_ERR(run_device(gas, vq));

    return driver.print_used();
}

int
main(int argc, char **argv) {
    Model::GuestAS gas;

    if (argc > 1 and strcmp(argv[1], "-v") == 0)
        Debug::current_level = Debug::DETAILLED;

    INFO("== Virtio queue example ==");

    Errno err = run(gas);
    if (err != Errno::NONE) {
        ERROR("Example failed: %s", errno2str(err));
        return 1;
    }

    return 0;
}
