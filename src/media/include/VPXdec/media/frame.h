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

#ifndef VD_VPXDEC_MEDIA_FRAME_H
#define VD_VPXDEC_MEDIA_FRAME_H

#include <VPXdec/media/buffer.h>
#include <VPXdec/media/frame_descriptor.h>
#include <VPXdec/media/frame_layout.h>
#include <VPXdec/media/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace vpxdec {

constexpr uint32_t kMaxPlanes = FrameLayout::kMaxNumPlanes;

// A read-only view of one plane held somewhere else: `size` bytes starting at `data`, rows
// `stride` bytes apart.
struct PlaneView
{
    const uint8_t* data = nullptr;
    size_t size = 0;
    uint32_t stride = 0;
};

// Where a plane sits inside a frame's backing buffer.
struct PlaneLayout
{
    size_t offset = 0;
    uint32_t stride = 0;
};

using PlaneViews = std::array<PlaneView, kMaxPlanes>;
using PlaneLayouts = std::array<PlaneLayout, kMaxPlanes>;

// - Frame ----------------------------------------------------------------------------------------

// A decoded picture: a descriptor plus, unless the frame is empty, a backing buffer and the
// position of each plane inside it. The buffer is either owned by the frame (allocate,
// copyFromPlanes) or shared with a buffer pool (attachSharedBuffer).
class Frame
{
public:
    Frame() = default;

    // Allocate a zeroed buffer with default row strides.
    ReturnCode allocate(const FrameDescriptor& desc);

    // Descriptor only, no pixel memory.
    ReturnCode createEmpty(const FrameDescriptor& desc);

    // Copy each plane view into a newly allocated buffer, keeping the source strides.
    ReturnCode copyFromPlanes(const FrameDescriptor& desc, const PlaneViews& planes);

    // View the planes in place inside `buffer`. Every plane must lie entirely within the buffer.
    ReturnCode attachSharedBuffer(const FrameDescriptor& desc, std::shared_ptr<Buffer> buffer,
                                  const PlaneLayouts& planes);

    // Drop the buffer (and plane positions), keeping the descriptor.
    void detach();

    // Copy the meaningful bytes of every row into `dst`, which must have the same descriptor and
    // a buffer.
    ReturnCode copyTo(Frame& dst) const;

    const FrameDescriptor& descriptor() const { return m_desc; }
    uint32_t planeCount() const { return FrameLayout::getPlaneCount(m_desc.format); }
    bool hasBuffer() const { return m_buffer != nullptr; }
    bool isAttached() const { return m_attached; }
    const std::shared_ptr<Buffer>& buffer() const { return m_buffer; }

    uint8_t* planeData(uint32_t plane);
    const uint8_t* planeData(uint32_t plane) const;
    uint32_t planeStride(uint32_t plane) const { return m_planes[plane].stride; }
    size_t planeOffset(uint32_t plane) const { return m_planes[plane].offset; }
    FrameLayout layout() const;

private:
    void reset(const FrameDescriptor& desc);

    FrameDescriptor m_desc;
    std::shared_ptr<Buffer> m_buffer;
    PlaneLayouts m_planes = {};
    bool m_attached = false;
};

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_FRAME_H
