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

#include <VPXdec/media/frame_pool.h>
//
#include <gtest/gtest.h>
//
#include <memory>
#include <thread>
#include <vector>

using namespace vpxdec;

namespace {

FrameDescriptor makeDesc(uint32_t width, uint32_t height)
{
    FrameDescriptor desc;
    desc.format = PixelFormat::I420;
    desc.width = width;
    desc.height = height;
    return desc;
}

class EmptyCreator : public FrameCreator
{
public:
    ReturnCode createFrame(const FrameDescriptor& desc, Frame& frame) const override
    {
        return frame.createEmpty(desc);
    }
};

} // namespace

class FramePoolFixture : public testing::Test
{
public:
    std::shared_ptr<FramePool> pool = std::make_shared<FramePool>();
};

TEST_F(FramePoolFixture, UnconfiguredPoolRefuses)
{
    std::shared_ptr<Frame> frame;
    EXPECT_FALSE(pool->isConfigured());
    EXPECT_EQ(pool->getFrame(makeDesc(16, 16), frame), ReturnCode::Uninitialized);
    EXPECT_EQ(frame, nullptr);
}

TEST_F(FramePoolFixture, DefaultCreatorAllocates)
{
    ASSERT_EQ(pool->configure(makeDesc(16, 16)), ReturnCode::Success);
    std::shared_ptr<Frame> frame;
    ASSERT_EQ(pool->getFrame(makeDesc(16, 16), frame), ReturnCode::Success);
    EXPECT_TRUE(frame->hasBuffer());
    EXPECT_EQ(pool->createdFrames(), 1u);
}

TEST_F(FramePoolFixture, MismatchedDescriptorIsRejected)
{
    ASSERT_EQ(pool->configure(makeDesc(16, 16)), ReturnCode::Success);
    std::shared_ptr<Frame> frame;
    EXPECT_EQ(pool->getFrame(makeDesc(32, 16), frame), ReturnCode::InvalidParam);
    EXPECT_EQ(pool->descriptor(), makeDesc(16, 16));
}

TEST_F(FramePoolFixture, DroppedFramesAreReused)
{
    ASSERT_EQ(pool->configure(makeDesc(16, 16)), ReturnCode::Success);
    const Frame* first = nullptr;
    {
        std::shared_ptr<Frame> frame;
        ASSERT_EQ(pool->getFrame(makeDesc(16, 16), frame), ReturnCode::Success);
        first = frame.get();
        EXPECT_EQ(pool->availableFrames(), 0u);
    }
    EXPECT_EQ(pool->availableFrames(), 1u);

    std::shared_ptr<Frame> again;
    ASSERT_EQ(pool->getFrame(makeDesc(16, 16), again), ReturnCode::Success);
    EXPECT_EQ(again.get(), first);
    EXPECT_EQ(pool->createdFrames(), 1u);
}

TEST_F(FramePoolFixture, ReturnedFramesDetachSharedBuffers)
{
    const FrameDescriptor desc = makeDesc(4, 4);
    ASSERT_EQ(pool->configure(desc, std::make_unique<EmptyCreator>()), ReturnCode::Success);

    auto buffer = std::make_shared<Buffer>(64);
    PlaneLayouts planes = {};
    planes[0] = {0, 8};
    planes[1] = {32, 4};
    planes[2] = {48, 4};
    {
        std::shared_ptr<Frame> frame;
        ASSERT_EQ(pool->getFrame(desc, frame), ReturnCode::Success);
        EXPECT_FALSE(frame->hasBuffer());
        ASSERT_EQ(frame->attachSharedBuffer(desc, buffer, planes), ReturnCode::Success);
        EXPECT_EQ(buffer.use_count(), 2);
    }
    EXPECT_EQ(buffer.use_count(), 1);
    EXPECT_EQ(pool->availableFrames(), 1u);
}

TEST_F(FramePoolFixture, FramesOutliveThePool)
{
    ASSERT_EQ(pool->configure(makeDesc(16, 16)), ReturnCode::Success);
    std::shared_ptr<Frame> frame;
    ASSERT_EQ(pool->getFrame(makeDesc(16, 16), frame), ReturnCode::Success);
    pool.reset();
    EXPECT_TRUE(frame->hasBuffer());
    frame.reset();
}

TEST_F(FramePoolFixture, ReconfigureDropsCachedFrames)
{
    ASSERT_EQ(pool->configure(makeDesc(16, 16)), ReturnCode::Success);
    std::shared_ptr<Frame> held;
    ASSERT_EQ(pool->getFrame(makeDesc(16, 16), held), ReturnCode::Success);
    {
        std::shared_ptr<Frame> frame;
        ASSERT_EQ(pool->getFrame(makeDesc(16, 16), frame), ReturnCode::Success);
    }
    EXPECT_EQ(pool->availableFrames(), 1u);
    ASSERT_EQ(pool->configure(makeDesc(32, 32)), ReturnCode::Success);
    EXPECT_EQ(pool->availableFrames(), 0u);

    // A frame of the old shape is not cached when it comes back.
    held.reset();
    EXPECT_EQ(pool->availableFrames(), 0u);
}

TEST_F(FramePoolFixture, FramesCanBeReturnedFromOtherThreads)
{
    ASSERT_EQ(pool->configure(makeDesc(16, 16)), ReturnCode::Success);
    std::vector<std::shared_ptr<Frame>> frames(8);
    for (auto& frame : frames) {
        ASSERT_EQ(pool->getFrame(makeDesc(16, 16), frame), ReturnCode::Success);
    }

    std::vector<std::thread> threads;
    for (auto& frame : frames) {
        threads.emplace_back([held = std::move(frame)]() mutable { held.reset(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(pool->availableFrames(), 8u);
}
