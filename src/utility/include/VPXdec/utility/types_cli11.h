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

// Support for VPXdec types via CLI11.
//
// NB: This is separate from types_convert.h to avoid forcing inclusion of <CLI/CLI.hpp>
//
#ifndef VD_VPXDEC_UTILITY_TYPES_CLI11_H
#define VD_VPXDEC_UTILITY_TYPES_CLI11_H

#include <VPXdec/media/types.h>
//
#include <CLI/CLI.hpp>

#include <string>

// NB: The operator>>() declarations for enum types do not work with CLI11, as its own
// specialisation of lexical_cast for enum overrides them. These are found by argument dependent
// lookup, so they live in the enums' namespace.
//
// These have to be non-templated functions to avoid ambiguous template resolution
//
namespace vpxdec {

bool lexical_cast(const std::string& input, PixelFormat& v);
bool lexical_cast(const std::string& input, CodecId& v);
bool lexical_cast(const std::string& input, ColorRange& v);
bool lexical_cast(const std::string& input, ColorMatrix& v);

} // namespace vpxdec

namespace CLI::detail {
template <>
constexpr const char* type_name<vpxdec::PixelFormat>()
{
    return "PIXELFORMAT";
}

template <>
constexpr const char* type_name<vpxdec::CodecId>()
{
    return "CODEC";
}

template <>
constexpr const char* type_name<vpxdec::ColorRange>()
{
    return "COLORRANGE";
}

template <>
constexpr const char* type_name<vpxdec::ColorMatrix>()
{
    return "COLORMATRIX";
}

} // namespace CLI::detail

#endif // VD_VPXDEC_UTILITY_TYPES_CLI11_H
