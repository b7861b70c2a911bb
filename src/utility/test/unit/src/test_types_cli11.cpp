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
//
#include <CLI/CLI.hpp>
#include <gtest/gtest.h>
//
#include <cstdlib>
#include <string>

using namespace vpxdec;

TEST(TypesCli11, ParsesEnumOptions)
{
    PixelFormat format = PixelFormat::Unknown;
    CodecId codec = CodecId::Unknown;

    CLI::App app{"test"};
    app.add_option("--format", format);
    app.add_option("--codec", codec);

    EXPECT_NO_THROW(app.parse("--codec vp90 --format i422", false));
    EXPECT_EQ(format, PixelFormat::I422);
    EXPECT_EQ(codec, CodecId::VP9);
}

TEST(TypesCli11, InvalidValueExits)
{
    ColorRange range = ColorRange::Unspecified;
    EXPECT_EXIT(lexical_cast(std::string("medium"), range), testing::ExitedWithCode(EXIT_FAILURE),
                "Not a valid ColorRange");
}
