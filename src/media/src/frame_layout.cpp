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

#include <VPXdec/media/frame_layout.h>

namespace vpxdec {

namespace {

    // Per format constants. Terminology:
    // Plane - a contiguous region of memory holding one or more color components.
    // Interleave - the number of components sharing a plane (2 for the UV plane of NV12).
    struct Info
    {
        PixelFormat format;
        uint8_t planes;
        uint8_t planeWidthShift[FrameLayout::kMaxNumPlanes];
        uint8_t planeHeightShift[FrameLayout::kMaxNumPlanes];
        uint8_t interleave[FrameLayout::kMaxNumPlanes];
        uint8_t bits;
    };

    const Info kFrameLayoutInfo[] = {
        // clang-format off
        //                    planes
        //                    |  planeWidthShift
        //                    |  |             planeHeightShift
        //                    |  |             |             interleave
        //                    |  |             |             |             bits
        {PixelFormat::YV12,   3, {0, 1, 1},    {0, 1, 1},    {1, 1, 1},    8},
        {PixelFormat::I420,   3, {0, 1, 1},    {0, 1, 1},    {1, 1, 1},    8},
        {PixelFormat::I422,   3, {0, 1, 1},    {0, 0, 0},    {1, 1, 1},    8},
        {PixelFormat::I444,   3, {0, 0, 0},    {0, 0, 0},    {1, 1, 1},    8},
        {PixelFormat::NV12,   2, {0, 1, 0},    {0, 1, 0},    {1, 2, 0},    8},
        {PixelFormat::I010,   3, {0, 1, 1},    {0, 1, 1},    {1, 1, 1},    10},
        {PixelFormat::I012,   3, {0, 1, 1},    {0, 1, 1},    {1, 1, 1},    12},
        {PixelFormat::I210,   3, {0, 1, 1},    {0, 0, 0},    {1, 1, 1},    10},
        {PixelFormat::I212,   3, {0, 1, 1},    {0, 0, 0},    {1, 1, 1},    12},
        {PixelFormat::I410,   3, {0, 0, 0},    {0, 0, 0},    {1, 1, 1},    10},
        {PixelFormat::I412,   3, {0, 0, 0},    {0, 0, 0},    {1, 1, 1},    12},
        // clang-format on
    };

    const Info kFrameLayoutInfoUnknown = {PixelFormat::Unknown, 0, {0, 0, 0}, {0, 0, 0}, {0, 0, 0}, 0};

    const Info& findLayoutInfo(PixelFormat format)
    {
        for (const Info& info : kFrameLayoutInfo) {
            if (info.format == format) {
                return info;
            }
        }
        return kFrameLayoutInfoUnknown;
    }

    uint32_t shiftRoundUp(uint32_t value, uint32_t shift)
    {
        return (value + (1u << shift) - 1) >> shift;
    }

    uint32_t alignUp(uint32_t value, uint32_t alignment)
    {
        return (value + alignment - 1) / alignment * alignment;
    }

} // namespace

// - FrameDescriptor ------------------------------------------------------------------------------

bool FrameDescriptor::isValid() const
{
    return format != PixelFormat::Unknown && findLayoutInfo(format).planes != 0 && width != 0 &&
           height != 0;
}

// - FrameLayout ----------------------------------------------------------------------------------

FrameLayout::FrameLayout(const FrameDescriptor& desc)
    : FrameLayout(desc.format, desc.width, desc.height)
{}

FrameLayout::FrameLayout(PixelFormat format, uint32_t width, uint32_t height)
    : m_format(format)
    , m_width(width)
    , m_height(height)
{
    for (uint32_t plane = 0; plane < planes(); ++plane) {
        m_rowStrides[plane] = defaultRowStride(plane);
    }
    generateOffsets();
}

FrameLayout::FrameLayout(const FrameDescriptor& desc, const Strides& rowStrides)
    : m_format(desc.format)
    , m_width(desc.width)
    , m_height(desc.height)
{
    for (uint32_t plane = 0; plane < planes(); ++plane) {
        m_rowStrides[plane] = rowStrides[plane];
    }
    generateOffsets();
}

void FrameLayout::generateOffsets()
{
    size_t offset = 0;
    for (uint32_t plane = 0; plane < planes(); ++plane) {
        m_planeOffsets[plane] = offset;
        offset += planeSize(plane);
    }
    m_size = offset;
}

bool FrameLayout::isValid() const
{
    if (planes() == 0 || m_width == 0 || m_height == 0) {
        return false;
    }
    for (uint32_t plane = 0; plane < planes(); ++plane) {
        if (m_rowStrides[plane] < rowSize(plane)) {
            return false;
        }
    }
    return true;
}

uint32_t FrameLayout::planes() const { return getPlaneCount(m_format); }

uint32_t FrameLayout::planeWidth(uint32_t plane) const
{
    return shiftRoundUp(m_width, getPlaneWidthShift(m_format, plane));
}

uint32_t FrameLayout::planeHeight(uint32_t plane) const
{
    return planeHeight(m_format, plane, m_height);
}

uint32_t FrameLayout::planeInterleave(uint32_t plane) const
{
    return getPlaneInterleave(m_format, plane);
}

uint32_t FrameLayout::rowSize(uint32_t plane) const { return rowSize(m_format, plane, m_width); }

uint32_t FrameLayout::defaultRowStride(uint32_t plane) const
{
    return alignUp(rowSize(plane), kDefaultRowAlignment);
}

size_t FrameLayout::planeSize(uint32_t plane) const
{
    return static_cast<size_t>(m_rowStrides[plane]) * planeHeight(plane);
}

uint32_t FrameLayout::sampleSize() const { return getBytesPerSample(m_format); }

uint32_t FrameLayout::sampleBits() const { return getBitsPerSample(m_format); }

uint32_t FrameLayout::getPlaneCount(PixelFormat format) { return findLayoutInfo(format).planes; }

uint32_t FrameLayout::getPlaneWidthShift(PixelFormat format, uint32_t plane)
{
    const Info& info = findLayoutInfo(format);
    return plane < info.planes ? info.planeWidthShift[plane] : 0;
}

uint32_t FrameLayout::getPlaneHeightShift(PixelFormat format, uint32_t plane)
{
    const Info& info = findLayoutInfo(format);
    return plane < info.planes ? info.planeHeightShift[plane] : 0;
}

uint32_t FrameLayout::getPlaneInterleave(PixelFormat format, uint32_t plane)
{
    const Info& info = findLayoutInfo(format);
    return plane < info.planes ? info.interleave[plane] : 0;
}

uint32_t FrameLayout::getBitsPerSample(PixelFormat format) { return findLayoutInfo(format).bits; }

uint32_t FrameLayout::getBytesPerSample(PixelFormat format)
{
    const uint32_t bits = getBitsPerSample(format);
    return bits == 0 ? 0 : (bits + 7) / 8;
}

uint32_t FrameLayout::planeHeight(PixelFormat format, uint32_t plane, uint32_t height)
{
    if (plane >= getPlaneCount(format)) {
        return 0;
    }
    return shiftRoundUp(height, getPlaneHeightShift(format, plane));
}

uint32_t FrameLayout::rowSize(PixelFormat format, uint32_t plane, uint32_t width)
{
    if (plane >= getPlaneCount(format)) {
        return 0;
    }
    return shiftRoundUp(width, getPlaneWidthShift(format, plane)) *
           getPlaneInterleave(format, plane) * getBytesPerSample(format);
}

} // namespace vpxdec
