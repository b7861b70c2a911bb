/* Copyright (c) V-Nova International Limited 2025-2026. All rights reserved.
 * This software is licensed under the BSD-3-Clause-Clear License by V-Nova Limited.
 * No patent licenses are granted under this license. For enquiries about patent licenses,
 * please contact legal@v-nova.com.
 * The VPXdec software is a stand-alone project and is NOT A CONTRIBUTION to any other project.
 * If the software is incorporated into another project, THE TERMS OF THE BSD-3-CLAUSE-CLEAR LICENSE
 * AND THE ADDITIONAL LICENSING INFORMATION CONTAINED IN THIS FILE MUST BE MAINTAINED, AND THE
 * SOFTWARE DOES NOT AND MUST NOT ADOPT THE LICENSE OF THE INCORPORATING PROJECT. However, the
 * software may be incorporated into a project under a compatible license provided the requirements
 * of the BSD-3-Clause-Clear license are respected, and V-Nova Limited remains
 * licensor of the software ONLY UNDER the BSD-3-Clause-Clear license (not the compatible license).
 * ANY ONWARD DISTRIBUTION, WHETHER STAND-ALONE OR AS PART OF ANY OTHER PROJECT, REMAINS SUBJECT TO
 * THE EXCLUSION OF PATENT LICENSES PROVISION OF THE BSD-3-CLAUSE-CLEAR LICENSE. */

#include <VPXdec/media/buffer.h>
//
#include <gtest/gtest.h>
//
#include <cstdint>
#include <memory>
#include <vector>

using namespace vpxdec;

TEST(Buffer, IsZeroInitialised)
{
    Buffer buffer(64);
    ASSERT_EQ(buffer.size(), 64u);
    for (size_t i = 0; i < buffer.size(); ++i) {
        EXPECT_EQ(buffer.data()[i], 0);
    }
}

TEST(Buffer, GrowNeverShrinks)
{
    Buffer buffer(64);
    EXPECT_TRUE(buffer.grow(32));
    EXPECT_EQ(buffer.size(), 64u);
    EXPECT_TRUE(buffer.grow(128));
    EXPECT_EQ(buffer.size(), 128u);
}

TEST(Buffer, FailedGrowLeavesBufferUnchanged)
{
    Buffer buffer(64);
    buffer.data()[0] = 3;
    EXPECT_FALSE(buffer.grow(SIZE_MAX));
    EXPECT_EQ(buffer.size(), 64u);
    EXPECT_EQ(buffer.data()[0], 3);
}

TEST(BufferPool, CapacityOnlyGrows)
{
    BufferPool pool;
    EXPECT_EQ(pool.bufferCapacity(), 0u);
    pool.setBufferCapacity(100);
    pool.setBufferCapacity(50);
    EXPECT_EQ(pool.bufferCapacity(), 100u);
}

TEST(BufferPool, ReusesFreeBuffers)
{
    BufferPool pool(256);
    const uint8_t* first = nullptr;
    {
        std::shared_ptr<Buffer> buffer = pool.getBuffer();
        ASSERT_NE(buffer, nullptr);
        EXPECT_EQ(buffer->size(), 256u);
        first = buffer->data();
        EXPECT_EQ(pool.outstandingReferences(), 1u);
    }
    EXPECT_EQ(pool.outstandingReferences(), 0u);

    std::shared_ptr<Buffer> again = pool.getBuffer();
    EXPECT_EQ(again->data(), first);
    EXPECT_EQ(pool.bufferCount(), 1u);
}

TEST(BufferPool, BusyBuffersAreNotHandedOutTwice)
{
    BufferPool pool(16);
    std::shared_ptr<Buffer> a = pool.getBuffer();
    std::shared_ptr<Buffer> b = pool.getBuffer();
    EXPECT_NE(a, b);
    EXPECT_EQ(pool.bufferCount(), 2u);
    EXPECT_EQ(pool.outstandingReferences(), 2u);
}

TEST(BufferPool, FreeBufferGrowsToNewCapacity)
{
    BufferPool pool(16);
    pool.getBuffer();
    pool.setBufferCapacity(1024);
    std::shared_ptr<Buffer> buffer = pool.getBuffer();
    EXPECT_EQ(pool.bufferCount(), 1u);
    EXPECT_GE(buffer->size(), 1024u);
}

TEST(BufferPool, ReleaseLeavesOutstandingBuffersAlive)
{
    BufferPool pool(32);
    std::shared_ptr<Buffer> held = pool.getBuffer();
    held->data()[0] = 7;
    pool.release();
    EXPECT_EQ(pool.bufferCount(), 0u);
    EXPECT_EQ(held.use_count(), 1);
    EXPECT_EQ(held->data()[0], 7);
}

TEST(BufferPool, GetBufferRaisesCapacityToRequest)
{
    BufferPool pool(16);
    std::shared_ptr<Buffer> buffer = pool.getBuffer(512);
    ASSERT_NE(buffer, nullptr);
    EXPECT_GE(buffer->size(), 512u);
    EXPECT_EQ(pool.bufferCapacity(), 512u);
}

TEST(BufferPool, FailedRequestKeepsCapacity)
{
    BufferPool pool(16);
    pool.getBuffer();
    EXPECT_EQ(pool.getBuffer(SIZE_MAX), nullptr);
    EXPECT_EQ(pool.bufferCapacity(), 16u);

    std::shared_ptr<Buffer> buffer = pool.getBuffer(32);
    ASSERT_NE(buffer, nullptr);
    EXPECT_EQ(pool.bufferCapacity(), 32u);
    EXPECT_EQ(pool.bufferCount(), 1u);
}
