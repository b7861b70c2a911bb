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

#include <VPXdec/common/log.h>
#include <VPXdec/media/frame.h>

#include <cstring>
#include <memory>
#include <new>
#include <utility>

namespace vpxdec {

static const LogComponent kComp = LogComponent::FramePool;

namespace {

    std::shared_ptr<Buffer> allocateBuffer(size_t size)
    {
        try {
            return std::make_shared<Buffer>(size);
        } catch (const std::bad_alloc&) {
            VDLogError("Failed to allocate %zu byte frame buffer\n", size);
            return nullptr;
        }
    }

    // Bytes a plane occupies from its first byte to the end of its last meaningful row.
    size_t planeExtent(const FrameDescriptor& desc, uint32_t plane, uint32_t stride)
    {
        const uint32_t height = FrameLayout::planeHeight(desc.format, plane, desc.height);
        if (height == 0) {
            return 0;
        }
        return static_cast<size_t>(stride) * (height - 1) +
               FrameLayout::rowSize(desc.format, plane, desc.width);
    }

} // namespace

void Frame::reset(const FrameDescriptor& desc)
{
    m_desc = desc;
    m_buffer.reset();
    m_planes = {};
    m_attached = false;
}

ReturnCode Frame::allocate(const FrameDescriptor& desc)
{
    if (!desc.isValid()) {
        VDLogError("Cannot allocate a frame for an invalid descriptor\n");
        return ReturnCode::InvalidParam;
    }
    const FrameLayout layout(desc);
    std::shared_ptr<Buffer> buffer = allocateBuffer(layout.size());
    if (!buffer) {
        return ReturnCode::Error;
    }

    reset(desc);
    m_buffer = std::move(buffer);
    for (uint32_t plane = 0; plane < layout.planes(); ++plane) {
        m_planes[plane] = {layout.planeOffset(plane), layout.rowStride(plane)};
    }
    return ReturnCode::Success;
}

ReturnCode Frame::createEmpty(const FrameDescriptor& desc)
{
    if (!desc.isValid()) {
        VDLogError("Cannot create a frame for an invalid descriptor\n");
        return ReturnCode::InvalidParam;
    }
    reset(desc);
    return ReturnCode::Success;
}

ReturnCode Frame::copyFromPlanes(const FrameDescriptor& desc, const PlaneViews& planes)
{
    if (!desc.isValid()) {
        VDLogError("Cannot copy into a frame with an invalid descriptor\n");
        return ReturnCode::InvalidParam;
    }

    FrameLayout::Strides strides = {};
    const uint32_t numPlanes = FrameLayout::getPlaneCount(desc.format);
    for (uint32_t plane = 0; plane < numPlanes; ++plane) {
        const PlaneView& view = planes[plane];
        const uint32_t height = FrameLayout::planeHeight(desc.format, plane, desc.height);
        if (view.data == nullptr || view.stride < FrameLayout::rowSize(desc.format, plane, desc.width) ||
            view.size < static_cast<size_t>(view.stride) * height) {
            VDLogError("Plane %u view is too small: %zu bytes, stride %u\n", plane, view.size,
                       view.stride);
            return ReturnCode::InvalidParam;
        }
        strides[plane] = view.stride;
    }

    const FrameLayout layout(desc, strides);
    std::shared_ptr<Buffer> buffer = allocateBuffer(layout.size());
    if (!buffer) {
        return ReturnCode::Error;
    }

    reset(desc);
    m_buffer = std::move(buffer);
    for (uint32_t plane = 0; plane < numPlanes; ++plane) {
        m_planes[plane] = {layout.planeOffset(plane), layout.rowStride(plane)};
        memcpy(m_buffer->data() + layout.planeOffset(plane), planes[plane].data,
               layout.planeSize(plane));
    }
    return ReturnCode::Success;
}

ReturnCode Frame::attachSharedBuffer(const FrameDescriptor& desc, std::shared_ptr<Buffer> buffer,
                                     const PlaneLayouts& planes)
{
    if (!desc.isValid() || !buffer) {
        VDLogError("Cannot attach %s\n", buffer ? "with an invalid descriptor" : "a null buffer");
        return ReturnCode::InvalidParam;
    }

    const uint32_t numPlanes = FrameLayout::getPlaneCount(desc.format);
    for (uint32_t plane = 0; plane < numPlanes; ++plane) {
        const PlaneLayout& entry = planes[plane];
        const size_t extent = planeExtent(desc, plane, entry.stride);
        if (entry.stride < FrameLayout::rowSize(desc.format, plane, desc.width) ||
            entry.offset >= buffer->size() || extent > buffer->size() - entry.offset) {
            VDLogError("Plane %u (offset %zu, stride %u) does not fit a %zu byte buffer\n", plane,
                       entry.offset, entry.stride, buffer->size());
            return ReturnCode::InvalidParam;
        }
    }

    reset(desc);
    m_buffer = std::move(buffer);
    m_planes = planes;
    m_attached = true;
    return ReturnCode::Success;
}

void Frame::detach()
{
    m_buffer.reset();
    m_planes = {};
    m_attached = false;
}

ReturnCode Frame::copyTo(Frame& dst) const
{
    if (!hasBuffer() || !dst.hasBuffer()) {
        VDLogError("Copy needs a buffer on both frames\n");
        return ReturnCode::InvalidParam;
    }
    if (m_desc != dst.m_desc) {
        VDLogError("Copy between frames of different descriptors\n");
        return ReturnCode::InvalidParam;
    }

    for (uint32_t plane = 0; plane < planeCount(); ++plane) {
        const uint32_t height = FrameLayout::planeHeight(m_desc.format, plane, m_desc.height);
        const uint32_t rowSize = FrameLayout::rowSize(m_desc.format, plane, m_desc.width);
        const uint8_t* src = planeData(plane);
        uint8_t* out = dst.planeData(plane);
        for (uint32_t row = 0; row < height; ++row) {
            memcpy(out, src, rowSize);
            src += planeStride(plane);
            out += dst.planeStride(plane);
        }
    }
    return ReturnCode::Success;
}

uint8_t* Frame::planeData(uint32_t plane)
{
    if (!m_buffer || plane >= planeCount()) {
        return nullptr;
    }
    return m_buffer->data() + m_planes[plane].offset;
}

const uint8_t* Frame::planeData(uint32_t plane) const
{
    if (!m_buffer || plane >= planeCount()) {
        return nullptr;
    }
    return m_buffer->data() + m_planes[plane].offset;
}

FrameLayout Frame::layout() const
{
    FrameLayout::Strides strides = {};
    for (uint32_t plane = 0; plane < planeCount(); ++plane) {
        strides[plane] = m_planes[plane].stride;
    }
    return FrameLayout(m_desc, strides);
}

} // namespace vpxdec
