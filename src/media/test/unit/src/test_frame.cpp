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

#include <VPXdec/media/frame.h>
//
#include <gtest/gtest.h>
//
#include <memory>
#include <numeric>
#include <vector>

using namespace vpxdec;

namespace {

FrameDescriptor makeDesc(PixelFormat format, uint32_t width, uint32_t height)
{
    FrameDescriptor desc;
    desc.format = format;
    desc.width = width;
    desc.height = height;
    desc.colorRange = ColorRange::Video;
    desc.colorMatrix = ColorMatrix::BT709;
    return desc;
}

} // namespace

TEST(Frame, AllocateUsesDefaultStrides)
{
    Frame frame;
    ASSERT_EQ(frame.allocate(makeDesc(PixelFormat::I420, 20, 10)), ReturnCode::Success);
    EXPECT_TRUE(frame.hasBuffer());
    EXPECT_FALSE(frame.isAttached());
    EXPECT_EQ(frame.planeCount(), 3u);
    EXPECT_EQ(frame.planeStride(0), 32u);
    EXPECT_EQ(frame.planeStride(1), 16u);
    EXPECT_EQ(frame.planeOffset(1), 320u);
}

TEST(Frame, InvalidDescriptorIsRejected)
{
    Frame frame;
    EXPECT_EQ(frame.allocate(makeDesc(PixelFormat::Unknown, 20, 10)), ReturnCode::InvalidParam);
    EXPECT_EQ(frame.createEmpty(makeDesc(PixelFormat::I420, 0, 10)), ReturnCode::InvalidParam);
}

TEST(Frame, EmptyFrameHasNoMemory)
{
    Frame frame;
    ASSERT_EQ(frame.createEmpty(makeDesc(PixelFormat::I444, 8, 8)), ReturnCode::Success);
    EXPECT_FALSE(frame.hasBuffer());
    EXPECT_EQ(frame.planeData(0), nullptr);
    EXPECT_EQ(frame.descriptor().width, 8u);
}

TEST(Frame, CopyFromPlanesKeepsStridesAndContent)
{
    const FrameDescriptor desc = makeDesc(PixelFormat::NV12, 4, 4);
    std::vector<uint8_t> luma(8 * 4);
    std::vector<uint8_t> chroma(8 * 2);
    std::iota(luma.begin(), luma.end(), uint8_t{0});
    std::iota(chroma.begin(), chroma.end(), uint8_t{100});

    PlaneViews views = {};
    views[0] = {luma.data(), luma.size(), 8};
    views[1] = {chroma.data(), chroma.size(), 8};

    Frame frame;
    ASSERT_EQ(frame.copyFromPlanes(desc, views), ReturnCode::Success);
    EXPECT_EQ(frame.planeStride(0), 8u);
    EXPECT_EQ(frame.planeStride(1), 8u);
    EXPECT_EQ(frame.planeData(0)[9], 9);
    EXPECT_EQ(frame.planeData(1)[3], 103);
    EXPECT_NE(frame.planeData(0), luma.data());
}

TEST(Frame, CopyFromPlanesRejectsShortViews)
{
    const FrameDescriptor desc = makeDesc(PixelFormat::I420, 4, 4);
    std::vector<uint8_t> bytes(64);
    PlaneViews views = {};
    views[0] = {bytes.data(), 16, 4};
    views[1] = {bytes.data(), 4, 2};
    views[2] = {bytes.data(), 3, 2};

    Frame frame;
    EXPECT_EQ(frame.copyFromPlanes(desc, views), ReturnCode::InvalidParam);
}

TEST(Frame, AttachSharesTheBuffer)
{
    const FrameDescriptor desc = makeDesc(PixelFormat::I420, 4, 4);
    auto buffer = std::make_shared<Buffer>(64);
    buffer->data()[40] = 42;

    PlaneLayouts planes = {};
    planes[0] = {0, 8};
    planes[1] = {32, 4};
    planes[2] = {40, 4};

    Frame frame;
    ASSERT_EQ(frame.attachSharedBuffer(desc, buffer, planes), ReturnCode::Success);
    EXPECT_TRUE(frame.isAttached());
    EXPECT_EQ(buffer.use_count(), 2);
    EXPECT_EQ(frame.planeData(2), buffer->data() + 40);
    EXPECT_EQ(frame.planeData(2)[0], 42);

    frame.detach();
    EXPECT_EQ(buffer.use_count(), 1);
    EXPECT_FALSE(frame.hasBuffer());
    EXPECT_EQ(frame.descriptor(), desc);
}

TEST(Frame, AttachRejectsPlanesOutsideTheBuffer)
{
    const FrameDescriptor desc = makeDesc(PixelFormat::I420, 4, 4);
    auto buffer = std::make_shared<Buffer>(48);

    PlaneLayouts planes = {};
    planes[0] = {0, 8};
    planes[1] = {32, 4};
    planes[2] = {46, 4};

    Frame frame;
    EXPECT_EQ(frame.attachSharedBuffer(desc, buffer, planes), ReturnCode::InvalidParam);
    EXPECT_EQ(buffer.use_count(), 1);
    EXPECT_FALSE(frame.hasBuffer());
}

TEST(Frame, CopyToCopiesMeaningfulRows)
{
    const FrameDescriptor desc = makeDesc(PixelFormat::I420, 4, 2);
    std::vector<uint8_t> luma = {1, 2, 3, 4, 9, 9, 5, 6, 7, 8, 9, 9};
    std::vector<uint8_t> u = {10, 11};
    std::vector<uint8_t> v = {20, 21};
    PlaneViews views = {};
    views[0] = {luma.data(), luma.size(), 6};
    views[1] = {u.data(), u.size(), 2};
    views[2] = {v.data(), v.size(), 2};

    Frame src;
    ASSERT_EQ(src.copyFromPlanes(desc, views), ReturnCode::Success);
    Frame dst;
    ASSERT_EQ(dst.allocate(desc), ReturnCode::Success);
    ASSERT_EQ(src.copyTo(dst), ReturnCode::Success);

    const uint8_t* row1 = dst.planeData(0) + dst.planeStride(0);
    EXPECT_EQ(dst.planeData(0)[3], 4);
    EXPECT_EQ(row1[0], 5);
    EXPECT_EQ(row1[3], 8);
    EXPECT_EQ(dst.planeData(1)[1], 11);
    EXPECT_EQ(dst.planeData(2)[0], 20);
}

TEST(Frame, CopyToNeedsMatchingDescriptor)
{
    Frame src;
    Frame dst;
    ASSERT_EQ(src.allocate(makeDesc(PixelFormat::I420, 4, 4)), ReturnCode::Success);
    ASSERT_EQ(dst.allocate(makeDesc(PixelFormat::I420, 8, 4)), ReturnCode::Success);
    EXPECT_EQ(src.copyTo(dst), ReturnCode::InvalidParam);
}
