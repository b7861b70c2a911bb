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

#include "format_translate.h"

#include <VPXdec/common/log.h>

namespace vpxdec::decoder {

static const LogComponent kComp = LogComponent::Image;

namespace {

    struct FormatEntry
    {
        vpx_img_fmt_t format;
        uint32_t bitDepth; // 0 for any
        PixelFormat pixelFormat;
    };

    const FormatEntry kFormatTable[] = {
        // clang-format off
        {VPX_IMG_FMT_YV12,   0,  PixelFormat::YV12},
        {VPX_IMG_FMT_I420,   0,  PixelFormat::I420},
        {VPX_IMG_FMT_I422,   0,  PixelFormat::I422},
        {VPX_IMG_FMT_I444,   0,  PixelFormat::I444},
        {VPX_IMG_FMT_NV12,   0,  PixelFormat::NV12},
        {VPX_IMG_FMT_I42016, 10, PixelFormat::I010},
        {VPX_IMG_FMT_I42016, 12, PixelFormat::I012},
        {VPX_IMG_FMT_I42216, 10, PixelFormat::I210},
        {VPX_IMG_FMT_I42216, 12, PixelFormat::I212},
        {VPX_IMG_FMT_I44416, 10, PixelFormat::I410},
        {VPX_IMG_FMT_I44416, 12, PixelFormat::I412},
        // clang-format on
    };

} // namespace

ReturnCode toPixelFormat(vpx_img_fmt_t format, uint32_t bitDepth, PixelFormat& out)
{
    for (const FormatEntry& entry : kFormatTable) {
        if (entry.format == format && (entry.bitDepth == 0 || entry.bitDepth == bitDepth)) {
            out = entry.pixelFormat;
            return ReturnCode::Success;
        }
    }

    VDLogError("Unsupported vpx image format 0x%x at %u bits\n", static_cast<unsigned>(format),
               bitDepth);
    out = PixelFormat::Unknown;
    return ReturnCode::UnsupportedFormat;
}

ColorRange toColorRange(vpx_color_range_t range)
{
    switch (range) {
        case VPX_CR_STUDIO_RANGE: return ColorRange::Video;
        case VPX_CR_FULL_RANGE: return ColorRange::Full;
    }
    return ColorRange::Unspecified;
}

ColorMatrix toColorMatrix(vpx_color_space_t space)
{
    switch (space) {
        case VPX_CS_UNKNOWN: return ColorMatrix::Unspecified;
        case VPX_CS_BT_601: return ColorMatrix::BT470BG;
        case VPX_CS_BT_709: return ColorMatrix::BT709;
        case VPX_CS_SMPTE_170: return ColorMatrix::SMPTE170M;
        case VPX_CS_SMPTE_240: return ColorMatrix::SMPTE240M;
        case VPX_CS_BT_2020: return ColorMatrix::BT2020NCL;
        case VPX_CS_RESERVED: return ColorMatrix::Reserved;
        case VPX_CS_SRGB: return ColorMatrix::Identity;
    }
    return ColorMatrix::Unspecified;
}

} // namespace vpxdec::decoder
