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

// A value type holding the memory layout (plane sizes, strides and offsets) of a frame of a given
// format and size.
//
#ifndef VD_VPXDEC_MEDIA_FRAME_LAYOUT_H
#define VD_VPXDEC_MEDIA_FRAME_LAYOUT_H

#include <VPXdec/media/frame_descriptor.h>
#include <VPXdec/media/types.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace vpxdec {

class FrameLayout
{
public:
    static constexpr uint32_t kMaxNumPlanes = 3;
    // Default row strides are padded to a multiple of this many bytes.
    static constexpr uint32_t kDefaultRowAlignment = 16;

    using Strides = std::array<uint32_t, kMaxNumPlanes>;

    FrameLayout() = default;
    explicit FrameLayout(const FrameDescriptor& desc);
    FrameLayout(const FrameDescriptor& desc, const Strides& rowStrides);
    FrameLayout(PixelFormat format, uint32_t width, uint32_t height);

    PixelFormat format() const { return m_format; }
    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }

    // True if the format is known, the dimensions are non-zero and every stride can hold a row.
    bool isValid() const;

    uint32_t planes() const;

    // Width of a plane in interleave units (one unit holds planeInterleave() samples).
    uint32_t planeWidth(uint32_t plane) const;
    // Height of a plane in rows. Subsampled planes round up, so odd heights keep their last row.
    uint32_t planeHeight(uint32_t plane) const;
    uint32_t planeInterleave(uint32_t plane) const;

    // Meaningful bytes in one row (may be less than the stride).
    uint32_t rowSize(uint32_t plane) const;
    uint32_t rowStride(uint32_t plane) const { return m_rowStrides[plane]; }
    uint32_t defaultRowStride(uint32_t plane) const;

    size_t planeOffset(uint32_t plane) const { return m_planeOffsets[plane]; }
    size_t planeSize(uint32_t plane) const;
    size_t size() const { return m_size; }

    uint32_t sampleSize() const;
    uint32_t sampleBits() const;

    // Static accessors, to get info about a format without building a layout.
    static uint32_t getPlaneCount(PixelFormat format);
    static uint32_t getPlaneWidthShift(PixelFormat format, uint32_t plane);
    static uint32_t getPlaneHeightShift(PixelFormat format, uint32_t plane);
    static uint32_t getPlaneInterleave(PixelFormat format, uint32_t plane);
    static uint32_t getBitsPerSample(PixelFormat format);
    static uint32_t getBytesPerSample(PixelFormat format);

    static uint32_t planeHeight(PixelFormat format, uint32_t plane, uint32_t height);
    static uint32_t rowSize(PixelFormat format, uint32_t plane, uint32_t width);

private:
    void generateOffsets();

    PixelFormat m_format = PixelFormat::Unknown;
    uint32_t m_width = 0;
    uint32_t m_height = 0;

    Strides m_rowStrides = {};
    std::array<size_t, kMaxNumPlanes> m_planeOffsets = {};
    size_t m_size = 0;
};

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_FRAME_LAYOUT_H
