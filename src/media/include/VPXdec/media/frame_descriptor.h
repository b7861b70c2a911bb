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

#ifndef VD_VPXDEC_MEDIA_FRAME_DESCRIPTOR_H
#define VD_VPXDEC_MEDIA_FRAME_DESCRIPTOR_H

#include <VPXdec/media/types.h>

#include <cstdint>

namespace vpxdec {

struct FrameDescriptor
{
    PixelFormat format = PixelFormat::Unknown;
    uint32_t width = 0;
    uint32_t height = 0;
    ColorRange colorRange = ColorRange::Unspecified;
    ColorMatrix colorMatrix = ColorMatrix::Unspecified;

    bool isValid() const;
};

inline bool operator==(const FrameDescriptor& lhs, const FrameDescriptor& rhs)
{
    return lhs.format == rhs.format && lhs.width == rhs.width && lhs.height == rhs.height &&
           lhs.colorRange == rhs.colorRange && lhs.colorMatrix == rhs.colorMatrix;
}

inline bool operator!=(const FrameDescriptor& lhs, const FrameDescriptor& rhs)
{
    return !(lhs == rhs);
}

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_FRAME_DESCRIPTOR_H
