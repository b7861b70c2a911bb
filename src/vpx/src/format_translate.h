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

// Mapping from libvpx image enumerations to frame descriptor enumerations.
//
#ifndef VD_VPXDEC_VPX_FORMAT_TRANSLATE_H
#define VD_VPXDEC_VPX_FORMAT_TRANSLATE_H

#include <VPXdec/media/types.h>
//
#include <vpx/vpx_image.h>

#include <cstdint>

namespace vpxdec::decoder {

// The 8 bit formats map whatever the bit depth; the 16 bit container formats need a depth of 10
// or 12. Anything else is UnsupportedFormat, and `out` is set to PixelFormat::Unknown.
ReturnCode toPixelFormat(vpx_img_fmt_t format, uint32_t bitDepth, PixelFormat& out);

ColorRange toColorRange(vpx_color_range_t range);

ColorMatrix toColorMatrix(vpx_color_space_t space);

} // namespace vpxdec::decoder

#endif // VD_VPXDEC_VPX_FORMAT_TRANSLATE_H
