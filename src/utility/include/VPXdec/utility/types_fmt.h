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

// Custom types for {fmt} - the formatting library.
//
#ifndef VD_VPXDEC_UTILITY_TYPES_FMT_H
#define VD_VPXDEC_UTILITY_TYPES_FMT_H

#include <VPXdec/media/frame_descriptor.h>
#include <VPXdec/media/types.h>
#include <VPXdec/utility/types_convert.h>
//
#include <fmt/format.h>

// vpxdec::ReturnCode
//
template <>
struct fmt::formatter<vpxdec::ReturnCode> : public formatter<string_view>
{
    template <typename FormatContext>
    auto format(const vpxdec::ReturnCode& rc, FormatContext& ctx) const
    {
        return formatter<string_view>::format(
            std::string("ReturnCode_") + std::string(vpxdec::utility::toString(rc)), ctx);
    }
};

// vpxdec::CodecId
template <>
struct fmt::formatter<vpxdec::CodecId> : public formatter<string_view>
{
    template <typename FormatContext>
    auto format(const vpxdec::CodecId& id, FormatContext& ctx) const
    {
        return formatter<string_view>::format(vpxdec::utility::toString(id), ctx);
    }
};

// vpxdec::PixelFormat
template <>
struct fmt::formatter<vpxdec::PixelFormat> : public formatter<string_view>
{
    template <typename FormatContext>
    auto format(const vpxdec::PixelFormat& pf, FormatContext& ctx) const
    {
        return formatter<string_view>::format(vpxdec::utility::toString(pf), ctx);
    }
};

// vpxdec::ColorRange
template <>
struct fmt::formatter<vpxdec::ColorRange> : public formatter<string_view>
{
    template <typename FormatContext>
    auto format(const vpxdec::ColorRange& cr, FormatContext& ctx) const
    {
        return formatter<string_view>::format(
            std::string("ColorRange_") + std::string(vpxdec::utility::toString(cr)), ctx);
    }
};

// vpxdec::ColorMatrix
template <>
struct fmt::formatter<vpxdec::ColorMatrix> : public formatter<string_view>
{
    template <typename FormatContext>
    auto format(const vpxdec::ColorMatrix& cm, FormatContext& ctx) const
    {
        return formatter<string_view>::format(
            std::string("ColorMatrix_") + std::string(vpxdec::utility::toString(cm)), ctx);
    }
};

// vpxdec::FrameDescriptor
template <>
struct fmt::formatter<vpxdec::FrameDescriptor>
{
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const vpxdec::FrameDescriptor& desc, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::format_to(ctx.out(), "{} {}x{} {} {}", desc.format, desc.width, desc.height,
                              desc.colorRange, desc.colorMatrix);
    }
};

#endif // VD_VPXDEC_UTILITY_TYPES_FMT_H
