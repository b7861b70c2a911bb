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

// Enumerations shared by every layer: return codes, codec identifiers and the color metadata
// carried by decoded frames.
//
#ifndef VD_VPXDEC_MEDIA_TYPES_H
#define VD_VPXDEC_MEDIA_TYPES_H

#include <cstdint>

namespace vpxdec {

enum class ReturnCode
{
    Success,
    // Not an error: no output is ready yet, feed more input (or flush) and try again.
    Again,
    NotFound,
    Error,
    Uninitialized,
    InvalidParam,
    NotSupported,
    UnsupportedCodec,
    UnsupportedFormat,
    DecodeError,
    // A zero-copy image pointed outside the buffer it claims to live in.
    IntegrityError,

    Count
};

enum class CodecId
{
    Unknown,
    VP8,
    VP9,
    AV1,
    H264,

    Count
};

enum class ColorRange
{
    Unspecified,
    Video,
    Full,

    Count
};

enum class ColorMatrix
{
    Unspecified,
    Identity,
    BT709,
    BT470BG,
    SMPTE170M,
    SMPTE240M,
    BT2020NCL,
    Reserved,

    Count
};

// Planar and semi-planar YUV layouts. The 10 and 12 bit formats store each sample in the low bits
// of a 16 bit little-endian word.
enum class PixelFormat
{
    Unknown,
    YV12,
    I420,
    I422,
    I444,
    NV12,
    I010,
    I012,
    I210,
    I212,
    I410,
    I412,

    Count
};

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_TYPES_H
