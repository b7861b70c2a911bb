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

#include "frame_buffer_bridge.h"
//
#include <gtest/gtest.h>
//
#include <cstdint>
#include <memory>
#include <vector>

using namespace vpxdec;
using namespace vpxdec::decoder;

class FrameBufferBridgeFixture : public testing::Test
{
public:
    BufferPool pool;
};

TEST_F(FrameBufferBridgeFixture, AcquireGrowsToRequestedSize)
{
    vpx_codec_frame_buffer_t fb{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 1000, &fb), 0);
    EXPECT_NE(fb.data, nullptr);
    EXPECT_GE(fb.size, 1000u);
    EXPECT_NE(fb.priv, nullptr);
    EXPECT_EQ(pool.bufferCapacity(), 1000u);

    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &fb), 0);
}

TEST_F(FrameBufferBridgeFixture, AcquiredMemoryIsZeroed)
{
    vpx_codec_frame_buffer_t fb{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 64, &fb), 0);
    for (size_t i = 0; i < 64; ++i) {
        fb.data[i] = 0xff;
    }
    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &fb), 0);

    vpx_codec_frame_buffer_t again{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 64, &again), 0);
    for (size_t i = 0; i < 64; ++i) {
        EXPECT_EQ(again.data[i], 0);
    }
    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &again), 0);
}

TEST_F(FrameBufferBridgeFixture, AcquireReleaseSymmetry)
{
    constexpr size_t kCount = 8;
    const size_t baseline = pool.outstandingReferences();

    std::vector<vpx_codec_frame_buffer_t> fbs(kCount);
    for (size_t i = 0; i < kCount; ++i) {
        ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 128 * (i + 1), &fbs[i]), 0);
    }
    EXPECT_EQ(pool.outstandingReferences(), baseline + kCount);
    EXPECT_EQ(pool.bufferCount(), kCount);

    for (size_t i = 0; i < kCount; ++i) {
        ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &fbs[i]), 0);
    }
    EXPECT_EQ(pool.outstandingReferences(), baseline);
}

TEST_F(FrameBufferBridgeFixture, BufferHeldElsewhereIsNotReused)
{
    vpx_codec_frame_buffer_t fb{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 256, &fb), 0);
    std::shared_ptr<Buffer> frameRef = *borrowFrameBuffer(fb.priv);
    EXPECT_EQ(frameRef.use_count(), 3);
    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &fb), 0);
    EXPECT_EQ(frameRef.use_count(), 2);

    vpx_codec_frame_buffer_t next{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 256, &next), 0);
    EXPECT_NE(next.data, frameRef->data());
    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &next), 0);
}

TEST_F(FrameBufferBridgeFixture, ReleaseOfNullHandleIsNoOp)
{
    vpx_codec_frame_buffer_t fb{};
    EXPECT_EQ(vpxdecReleaseFrameBuffer(&pool, &fb), 0);
    EXPECT_EQ(vpxdecReleaseFrameBuffer(&pool, nullptr), 0);
}

TEST_F(FrameBufferBridgeFixture, AcquireWithoutPoolFails)
{
    vpx_codec_frame_buffer_t fb{};
    EXPECT_LT(vpxdecGetFrameBuffer(nullptr, 64, &fb), 0);
    EXPECT_EQ(fb.priv, nullptr);
}

TEST_F(FrameBufferBridgeFixture, OversizedAcquireFailsAndPoolRecovers)
{
    vpx_codec_frame_buffer_t small{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 64, &small), 0);
    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &small), 0);

    vpx_codec_frame_buffer_t huge{};
    EXPECT_LT(vpxdecGetFrameBuffer(&pool, SIZE_MAX, &huge), 0);
    EXPECT_EQ(huge.data, nullptr);
    EXPECT_EQ(huge.size, 0u);
    EXPECT_EQ(huge.priv, nullptr);
    EXPECT_EQ(pool.bufferCapacity(), 64u);
    EXPECT_EQ(pool.outstandingReferences(), 0u);

    vpx_codec_frame_buffer_t next{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 64, &next), 0);
    EXPECT_GE(next.size, 64u);
    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &next), 0);
}

TEST_F(FrameBufferBridgeFixture, OversizedFirstAcquireLeavesPoolEmpty)
{
    vpx_codec_frame_buffer_t huge{};
    EXPECT_LT(vpxdecGetFrameBuffer(&pool, SIZE_MAX, &huge), 0);
    EXPECT_EQ(pool.bufferCapacity(), 0u);
    EXPECT_EQ(pool.bufferCount(), 0u);

    vpx_codec_frame_buffer_t fb{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 128, &fb), 0);
    EXPECT_EQ(pool.bufferCapacity(), 128u);
    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &fb), 0);
}

TEST_F(FrameBufferBridgeFixture, BorrowDoesNotChangeCount)
{
    vpx_codec_frame_buffer_t fb{};
    ASSERT_EQ(vpxdecGetFrameBuffer(&pool, 32, &fb), 0);
    const std::shared_ptr<Buffer>* borrowed = borrowFrameBuffer(fb.priv);
    ASSERT_NE(borrowed, nullptr);
    EXPECT_EQ(borrowed->use_count(), 2);
    EXPECT_EQ(borrowFrameBuffer(nullptr), nullptr);
    ASSERT_EQ(vpxdecReleaseFrameBuffer(&pool, &fb), 0);
}
