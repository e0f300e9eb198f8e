/**
 * Copyright (c) 2019-2022 BedRock Systems, Inc.
 * This software is distributed under the terms of the BedRock Open-Source License.
 * See the LICENSE-BedRock file in the repository root for details.
 */

#include <gtest/gtest.h>

#include <model/simple_as.hpp>
#include <model/virtio_chain.hpp>

#include "mock_split_queue.hpp"

class DescriptorChainTest : public ::testing::Test {
protected:
    static constexpr uint16 QSIZE = 16;

    DescriptorChainTest() : vq(mem, QSIZE) {}

    void SetUp() override { ASSERT_TRUE(mem.construct(GPA(0), 0x10000)); }

    Virtio::DescriptorChain chain_at(uint16 head) const {
        return Virtio::DescriptorChain(mem, vq.desc_table_addr(), QSIZE, head);
    }

    void write_table(uint64 addr, uint16 idx, const Virtio::SplitDescriptor &d) const {
        ASSERT_EQ(mem.write_obj(GPA(addr + idx * Virtio::SplitDescriptor::ENTRY_SIZE_BYTES), d), Errno::NONE);
    }

    Model::SimpleAS mem;
    MockSplitQueue vq;
};

TEST_F(DescriptorChainTest, EmptyChain) {
    Virtio::DescriptorChain chain;
    Virtio::Descriptor d;

    EXPECT_EQ(chain.next(d), Errno::NOENT);
    EXPECT_EQ(chain.error(), Errno::NONE);
    EXPECT_EQ(chain.memory(), nullptr);
}

TEST_F(DescriptorChainTest, FollowsNextLinks) {
    ASSERT_EQ(vq.set_desc(3, Virtio::SplitDescriptor(0x1000, 0x100, VIRTQ_DESC_CONT_NEXT, 7)), Errno::NONE);
    ASSERT_EQ(vq.set_desc(7, Virtio::SplitDescriptor(0x2000, 0x200, VIRTQ_DESC_WRITE_ONLY, 0)), Errno::NONE);

    Virtio::DescriptorChain chain = chain_at(3);
    Virtio::Descriptor d;

    EXPECT_EQ(chain.head_index(), 3);
    EXPECT_EQ(chain.memory(), &mem);

    ASSERT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x1000u);
    EXPECT_EQ(d.len(), 0x100u);
    EXPECT_FALSE(d.is_write_only());

    ASSERT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x2000u);
    EXPECT_TRUE(d.is_write_only());

    EXPECT_EQ(chain.next(d), Errno::NOENT);
    EXPECT_EQ(chain.next(d), Errno::NOENT);
    EXPECT_EQ(chain.error(), Errno::NONE);
    EXPECT_FALSE(chain.is_indirect());
}

TEST_F(DescriptorChainTest, LoopIsBoundedByQueueSize) {
    ASSERT_EQ(vq.set_desc(0, Virtio::SplitDescriptor(0x1000, 0x10, VIRTQ_DESC_CONT_NEXT, 1)), Errno::NONE);
    ASSERT_EQ(vq.set_desc(1, Virtio::SplitDescriptor(0x2000, 0x10, VIRTQ_DESC_CONT_NEXT, 0)), Errno::NONE);

    Virtio::DescriptorChain chain = chain_at(0);
    Virtio::Descriptor d;
    unsigned count = 0;
    Errno err;

    while ((err = chain.next(d)) == Errno::NONE)
        count++;

    EXPECT_EQ(count, QSIZE);
    EXPECT_EQ(err, Errno::NOTRECOVERABLE);
    EXPECT_EQ(chain.error(), Errno::NOTRECOVERABLE);
    EXPECT_EQ(chain.next(d), Errno::NOTRECOVERABLE);
}

TEST_F(DescriptorChainTest, IndexOutOfRange) {
    ASSERT_EQ(vq.set_desc(0, Virtio::SplitDescriptor(0x1000, 0x10, VIRTQ_DESC_CONT_NEXT, QSIZE)), Errno::NONE);

    Virtio::DescriptorChain chain = chain_at(0);
    Virtio::Descriptor d;

    EXPECT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(chain.next(d), Errno::RANGE);
    EXPECT_EQ(chain.error(), Errno::RANGE);

    Virtio::DescriptorChain bad_head = chain_at(QSIZE + 4);
    EXPECT_EQ(bad_head.next(d), Errno::RANGE);
}

TEST_F(DescriptorChainTest, TableAddressOverflow) {
    Virtio::DescriptorChain chain(mem, GPA(~0ull - 0x10), QSIZE, 2);
    Virtio::Descriptor d;

    EXPECT_EQ(chain.next(d), Errno::ADDR_OVERFLOW);
}

TEST_F(DescriptorChainTest, UnreadableTable) {
    Virtio::DescriptorChain chain(mem, GPA(0x20000), QSIZE, 0);
    Virtio::Descriptor d;

    EXPECT_EQ(chain.next(d), Errno::FAULT);
}

TEST_F(DescriptorChainTest, IndirectTable) {
    const uint64 table = 0x2000;

    ASSERT_EQ(vq.set_desc(0, Virtio::SplitDescriptor(0x1000, 0x8, VIRTQ_DESC_CONT_NEXT, 1)), Errno::NONE);
    ASSERT_EQ(vq.set_desc(1, Virtio::SplitDescriptor(table, 3 * 16, VIRTQ_DESC_INDIRECT_LIST, 0)), Errno::NONE);
    write_table(table, 0, Virtio::SplitDescriptor(0x3000, 0x10, VIRTQ_DESC_CONT_NEXT, 1));
    write_table(table, 1, Virtio::SplitDescriptor(0x4000, 0x20, VIRTQ_DESC_CONT_NEXT, 2));
    write_table(table, 2, Virtio::SplitDescriptor(0x5000, 0x30, VIRTQ_DESC_WRITE_ONLY, 0));

    Virtio::DescriptorChain chain = chain_at(0);
    Virtio::Descriptor d;

    ASSERT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x1000u);
    EXPECT_FALSE(chain.is_indirect());

    ASSERT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x3000u);
    EXPECT_TRUE(chain.is_indirect());

    ASSERT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x4000u);

    ASSERT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x5000u);
    EXPECT_TRUE(d.is_write_only());

    EXPECT_EQ(chain.next(d), Errno::NOENT);
    EXPECT_EQ(chain.head_index(), 0);
}

TEST_F(DescriptorChainTest, NestedIndirectTable) {
    const uint64 table = 0x2000;

    ASSERT_EQ(vq.set_desc(0, Virtio::SplitDescriptor(table, 2 * 16, VIRTQ_DESC_INDIRECT_LIST, 0)), Errno::NONE);
    write_table(table, 0, Virtio::SplitDescriptor(0x3000, 0x10, VIRTQ_DESC_CONT_NEXT, 1));
    write_table(table, 1, Virtio::SplitDescriptor(0x4000, 0x20, VIRTQ_DESC_INDIRECT_LIST, 0));

    Virtio::DescriptorChain chain = chain_at(0);
    Virtio::Descriptor d;

    EXPECT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(chain.next(d), Errno::NOTRECOVERABLE);
    EXPECT_EQ(chain.error(), Errno::NOTRECOVERABLE);
}

TEST_F(DescriptorChainTest, ChainedIndirectDescriptor) {
    ASSERT_EQ(vq.set_desc(0, Virtio::SplitDescriptor(0x2000, 16, VIRTQ_DESC_INDIRECT_LIST | VIRTQ_DESC_CONT_NEXT, 1)),
              Errno::NONE);

    Virtio::DescriptorChain chain = chain_at(0);
    Virtio::Descriptor d;

    EXPECT_EQ(chain.next(d), Errno::NOTRECOVERABLE);
}

TEST_F(DescriptorChainTest, InvalidIndirectLength) {
    Virtio::Descriptor d;

    ASSERT_EQ(vq.set_desc(0, Virtio::SplitDescriptor(0x2000, 0, VIRTQ_DESC_INDIRECT_LIST, 0)), Errno::NONE);
    ASSERT_EQ(vq.set_desc(1, Virtio::SplitDescriptor(0x2000, 20, VIRTQ_DESC_INDIRECT_LIST, 0)), Errno::NONE);
    ASSERT_EQ(vq.set_desc(2, Virtio::SplitDescriptor(0x2000, 0xffff0 + 16, VIRTQ_DESC_INDIRECT_LIST, 0)), Errno::NONE);

    Virtio::DescriptorChain empty = chain_at(0);
    EXPECT_EQ(empty.next(d), Errno::NOTRECOVERABLE);

    Virtio::DescriptorChain unaligned = chain_at(1);
    EXPECT_EQ(unaligned.next(d), Errno::NOTRECOVERABLE);

    Virtio::DescriptorChain too_big = chain_at(2);
    EXPECT_EQ(too_big.next(d), Errno::NOTRECOVERABLE);
}

TEST_F(DescriptorChainTest, IndirectLoopIsBoundedByTableLength) {
    const uint64 table = 0x2000;

    ASSERT_EQ(vq.set_desc(0, Virtio::SplitDescriptor(table, 2 * 16, VIRTQ_DESC_INDIRECT_LIST, 0)), Errno::NONE);
    write_table(table, 0, Virtio::SplitDescriptor(0x3000, 0x10, VIRTQ_DESC_CONT_NEXT, 1));
    write_table(table, 1, Virtio::SplitDescriptor(0x4000, 0x10, VIRTQ_DESC_CONT_NEXT, 0));

    Virtio::DescriptorChain chain = chain_at(0);
    Virtio::Descriptor d;

    EXPECT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(chain.next(d), Errno::NONE);
    EXPECT_EQ(chain.next(d), Errno::NOTRECOVERABLE);
}

TEST_F(DescriptorChainTest, ReadableAndWritableParts) {
    ASSERT_EQ(vq.set_desc(0, Virtio::SplitDescriptor(0x1000, 0x10, VIRTQ_DESC_CONT_NEXT, 1)), Errno::NONE);
    ASSERT_EQ(vq.set_desc(1, Virtio::SplitDescriptor(0x2000, 0x10, VIRTQ_DESC_CONT_NEXT, 2)), Errno::NONE);
    ASSERT_EQ(vq.set_desc(2, Virtio::SplitDescriptor(0x3000, 0x10, VIRTQ_DESC_CONT_NEXT | VIRTQ_DESC_WRITE_ONLY, 3)),
              Errno::NONE);
    ASSERT_EQ(vq.set_desc(3, Virtio::SplitDescriptor(0x4000, 0x10, VIRTQ_DESC_WRITE_ONLY, 0)), Errno::NONE);

    Virtio::Descriptor d;

    Virtio::DescriptorChain readable = chain_at(0);
    ASSERT_EQ(readable.next_readable(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x1000u);
    ASSERT_EQ(readable.next_readable(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x2000u);
    EXPECT_EQ(readable.next_readable(d), Errno::NOENT);

    Virtio::DescriptorChain writable = chain_at(0);
    ASSERT_EQ(writable.next_writable(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x3000u);
    ASSERT_EQ(writable.next_writable(d), Errno::NONE);
    EXPECT_EQ(d.addr(), 0x4000u);
    EXPECT_EQ(writable.next_writable(d), Errno::NOENT);
}
