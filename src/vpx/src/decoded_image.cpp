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

#include "decoded_image.h"

#include "format_translate.h"
#include "frame_buffer_bridge.h"

#include <VPXdec/common/log.h>
#include <VPXdec/media/frame_layout.h>

#include <cstdint>

namespace vpxdec::decoder {

static const LogComponent kComp = LogComponent::Image;

int VpxImage::vpxPlaneIndex(PixelFormat format, uint32_t plane)
{
    if (format == PixelFormat::YV12 && plane != 0) {
        return plane == 1 ? VPX_PLANE_V : VPX_PLANE_U;
    }
    return static_cast<int>(plane);
}

ReturnCode VpxImage::descriptor(FrameDescriptor& descOut) const
{
    PixelFormat format = PixelFormat::Unknown;
    if (const ReturnCode res = toPixelFormat(m_image.fmt, m_image.bit_depth, format);
        res != ReturnCode::Success) {
        return res;
    }

    FrameDescriptor desc;
    desc.format = format;
    desc.width = m_image.d_w;
    desc.height = m_image.d_h;
    desc.colorRange = toColorRange(m_image.range);
    desc.colorMatrix = toColorMatrix(m_image.cs);
    if (!desc.isValid()) {
        VDLogError("Image has no area: %ux%u\n", desc.width, desc.height);
        return ReturnCode::UnsupportedFormat;
    }

    descOut = desc;
    return ReturnCode::Success;
}

ReturnCode VpxImage::toOwnedFrame(Frame& frameOut) const
{
    FrameDescriptor desc;
    if (const ReturnCode res = descriptor(desc); res != ReturnCode::Success) {
        return res;
    }

    PlaneViews views = {};
    for (uint32_t plane = 0; plane < FrameLayout::getPlaneCount(desc.format); ++plane) {
        const int index = vpxPlaneIndex(desc.format, plane);
        const int stride = m_image.stride[index];
        if (m_image.planes[index] == nullptr || stride <= 0) {
            VDLogError("Plane %u has no data (stride %d)\n", plane, stride);
            return ReturnCode::Error;
        }
        const uint32_t height = FrameLayout::planeHeight(desc.format, plane, desc.height);
        views[plane].data = m_image.planes[index];
        views[plane].stride = static_cast<uint32_t>(stride);
        views[plane].size = static_cast<size_t>(stride) * height;
    }

    return frameOut.copyFromPlanes(desc, views);
}

ReturnCode VpxImage::toSharedBuffer(SharedImage& sharedOut) const
{
    const std::shared_ptr<Buffer>* borrowed = borrowFrameBuffer(m_image.fb_priv);
    if (borrowed == nullptr || !*borrowed) {
        VDLogError("Image has no external buffer\n");
        return ReturnCode::InvalidParam;
    }

    FrameDescriptor desc;
    if (const ReturnCode res = descriptor(desc); res != ReturnCode::Success) {
        return res;
    }

    // Plane pointers become offsets here, and only here. Nothing is published until every plane
    // has been checked.
    const Buffer& buffer = **borrowed;
    const uintptr_t base = reinterpret_cast<uintptr_t>(buffer.data());
    PlaneLayouts planes = {};
    for (uint32_t plane = 0; plane < FrameLayout::getPlaneCount(desc.format); ++plane) {
        const int index = vpxPlaneIndex(desc.format, plane);
        const uintptr_t address = reinterpret_cast<uintptr_t>(m_image.planes[index]);
        const int stride = m_image.stride[index];
        if (address < base || address - base >= buffer.size() || stride <= 0) {
            VDLogError("Plane %u at %p (stride %d) is outside its %zu byte buffer at %p\n", plane,
                       static_cast<const void*>(m_image.planes[index]), stride, buffer.size(),
                       static_cast<const void*>(buffer.data()));
            return ReturnCode::IntegrityError;
        }
        // The last row must end inside the buffer too.
        const size_t rowSize = FrameLayout::rowSize(desc.format, plane, desc.width);
        const uint32_t height = FrameLayout::planeHeight(desc.format, plane, desc.height);
        const size_t extent =
            height == 0 ? 0 : static_cast<size_t>(stride) * (height - 1) + rowSize;
        if (static_cast<size_t>(stride) < rowSize || extent > buffer.size() - (address - base)) {
            VDLogError("Plane %u rows (stride %d, %u rows) run past the end of its %zu byte buffer\n",
                       plane, stride, height, buffer.size());
            return ReturnCode::IntegrityError;
        }
        planes[plane].offset = static_cast<size_t>(address - base);
        planes[plane].stride = static_cast<uint32_t>(stride);
    }

    sharedOut.buffer = *borrowed;
    sharedOut.planes = planes;
    sharedOut.desc = desc;
    return ReturnCode::Success;
}

} // namespace vpxdec::decoder
