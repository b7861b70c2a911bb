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

#include <VPXdec/utility/types_cli11.h>
#include <VPXdec/utility/types_convert.h>
//
#include <fmt/core.h>
//
#include <cstdlib>

namespace vpxdec {

using utility::fromString;

bool lexical_cast(const std::string& input, PixelFormat& v) // NOLINT
{
    if (!fromString(input, v)) {
        fmt::print(stderr, "Not a valid PixelFormat: '{}'\n", input);
        std::exit(EXIT_FAILURE);
    }

    return true;
}

bool lexical_cast(const std::string& input, CodecId& v) // NOLINT
{
    if (!fromString(input, v)) {
        fmt::print(stderr, "Not a valid Codec: '{}'\n", input);
        std::exit(EXIT_FAILURE);
    }

    return true;
}

bool lexical_cast(const std::string& input, ColorRange& v) // NOLINT
{
    if (!fromString(input, v)) {
        fmt::print(stderr, "Not a valid ColorRange: '{}'\n", input);
        std::exit(EXIT_FAILURE);
    }

    return true;
}

bool lexical_cast(const std::string& input, ColorMatrix& v) // NOLINT
{
    if (!fromString(input, v)) {
        fmt::print(stderr, "Not a valid ColorMatrix: '{}'\n", input);
        std::exit(EXIT_FAILURE);
    }

    return true;
}

} // namespace vpxdec
