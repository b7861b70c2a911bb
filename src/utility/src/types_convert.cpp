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

#include <VPXdec/common/enum_map.h>
#include <VPXdec/utility/types_convert.h>

#include <cstddef>
#include <string_view>

namespace vpxdec::utility {

//// ReturnCode
//
static constexpr EnumMapArr<ReturnCode, static_cast<size_t>(ReturnCode::Count)> kReturnCodeMap{{{
    {ReturnCode::Success, "Success"},
    {ReturnCode::Again, "Again"},
    {ReturnCode::NotFound, "NotFound"},
    {ReturnCode::Error, "Error"},
    {ReturnCode::Uninitialized, "Uninitialized"},
    {ReturnCode::InvalidParam, "InvalidParam"},
    {ReturnCode::NotSupported, "NotSupported"},
    {ReturnCode::UnsupportedCodec, "UnsupportedCodec"},
    {ReturnCode::UnsupportedFormat, "UnsupportedFormat"},
    {ReturnCode::DecodeError, "DecodeError"},
    {ReturnCode::IntegrityError, "IntegrityError"},
}}};
static_assert(!kReturnCodeMap.isMissingEnums(), "kReturnCodeMap is missing an entry for some enum.");

std::string_view toString(ReturnCode returnCode)
{
    const std::string_view str = enumToString(kReturnCodeMap, returnCode);
    return str.empty() ? "Unknown" : str;
}

bool fromString(std::string_view str, ReturnCode& out)
{
    return enumFromString(kReturnCodeMap, str, ReturnCode::Error, out);
}

//// CodecId
//
// The IVF fourccs are accepted as synonyms.
static constexpr EnumMapArr<CodecId, static_cast<size_t>(CodecId::Count), 8> kCodecIdMap{{{
    {CodecId::Unknown, "Unknown"},
    {CodecId::VP8, "VP8"},
    {CodecId::VP9, "VP9"},
    {CodecId::AV1, "AV1"},
    {CodecId::H264, "H264"},

    {CodecId::VP8, "VP80"},
    {CodecId::VP9, "VP90"},
    {CodecId::AV1, "AV01"},
}}};
static_assert(!kCodecIdMap.isMissingEnums(), "kCodecIdMap is missing an entry for some enum.");

std::string_view toString(CodecId codecId) { return enumToString(kCodecIdMap, codecId); }

bool fromString(std::string_view str, CodecId& out)
{
    return enumFromString(kCodecIdMap, str, CodecId::Unknown, out);
}

//// PixelFormat
//
static constexpr EnumMapArr<PixelFormat, static_cast<size_t>(PixelFormat::Count), 16> kPixelFormatMap{{{
    {PixelFormat::Unknown, "Unknown"},
    {PixelFormat::YV12, "YV12"},
    {PixelFormat::I420, "I420"},
    {PixelFormat::I422, "I422"},
    {PixelFormat::I444, "I444"},
    {PixelFormat::NV12, "NV12"},
    {PixelFormat::I010, "I010"},
    {PixelFormat::I012, "I012"},
    {PixelFormat::I210, "I210"},
    {PixelFormat::I212, "I212"},
    {PixelFormat::I410, "I410"},
    {PixelFormat::I412, "I412"},

    // Other common synonyms
    {PixelFormat::I420, "yuv420p"},
    {PixelFormat::I422, "yuv422p"},
    {PixelFormat::I444, "yuv444p"},
    {PixelFormat::I010, "yuv420p10le"},
}}};
static_assert(!kPixelFormatMap.isMissingEnums(), "kPixelFormatMap is missing an entry for some enum.");

std::string_view toString(PixelFormat pixelFormat)
{
    return enumToString(kPixelFormatMap, pixelFormat);
}

bool fromString(std::string_view str, PixelFormat& out)
{
    return enumFromString(kPixelFormatMap, str, PixelFormat::Unknown, out);
}

//// ColorRange
//
static constexpr EnumMapArr<ColorRange, static_cast<size_t>(ColorRange::Count), 5> kColorRangeMap{{{
    {ColorRange::Unspecified, "Unspecified"},
    {ColorRange::Video, "Video"},
    {ColorRange::Full, "Full"},

    {ColorRange::Video, "Limited"},
    {ColorRange::Video, "Studio"},
}}};
static_assert(!kColorRangeMap.isMissingEnums(), "kColorRangeMap is missing an entry for some enum.");

std::string_view toString(ColorRange colorRange) { return enumToString(kColorRangeMap, colorRange); }

bool fromString(std::string_view str, ColorRange& out)
{
    return enumFromString(kColorRangeMap, str, ColorRange::Unspecified, out);
}

//// ColorMatrix
//
static constexpr EnumMapArr<ColorMatrix, static_cast<size_t>(ColorMatrix::Count), 10> kColorMatrixMap{{{
    {ColorMatrix::Unspecified, "Unspecified"},
    {ColorMatrix::Identity, "Identity"},
    {ColorMatrix::BT709, "BT709"},
    {ColorMatrix::BT470BG, "BT470BG"},
    {ColorMatrix::SMPTE170M, "SMPTE170M"},
    {ColorMatrix::SMPTE240M, "SMPTE240M"},
    {ColorMatrix::BT2020NCL, "BT2020NCL"},
    {ColorMatrix::Reserved, "Reserved"},

    {ColorMatrix::BT470BG, "BT601"},
    {ColorMatrix::Identity, "RGB"},
}}};
static_assert(!kColorMatrixMap.isMissingEnums(), "kColorMatrixMap is missing an entry for some enum.");

std::string_view toString(ColorMatrix colorMatrix)
{
    return enumToString(kColorMatrixMap, colorMatrix);
}

bool fromString(std::string_view str, ColorMatrix& out)
{
    return enumFromString(kColorMatrixMap, str, ColorMatrix::Unspecified, out);
}

} // namespace vpxdec::utility
