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

#include <VPXdec/utility/check.h>
//
#include <gtest/gtest.h>
//
#include <cstdlib>

using namespace vpxdec;

namespace {

ReturnCode forward(ReturnCode rc)
{
    VD_VPXDEC_CHECK_RET(rc);
    return ReturnCode::Success;
}

} // namespace

TEST(Check, AgainIsNotAnError)
{
    EXPECT_TRUE(VD_VPXDEC_AGAIN(ReturnCode::Success));
    EXPECT_FALSE(VD_VPXDEC_AGAIN(ReturnCode::Again));
}

TEST(Check, CheckRetForwardsErrors)
{
    EXPECT_EQ(forward(ReturnCode::Success), ReturnCode::Success);
    EXPECT_EQ(forward(ReturnCode::IntegrityError), ReturnCode::IntegrityError);
}

TEST(CheckDeathTest, ErrorsExit)
{
    EXPECT_EXIT(VD_VPXDEC_CHECK(ReturnCode::DecodeError), testing::ExitedWithCode(EXIT_FAILURE),
                "ReturnCode_DecodeError");
    EXPECT_EXIT(VD_VPXDEC_AGAIN(ReturnCode::InvalidParam), testing::ExitedWithCode(EXIT_FAILURE),
                "ReturnCode_InvalidParam");
    EXPECT_EXIT(VD_UTILITY_CHECK_MSG(false, "no output"), testing::ExitedWithCode(EXIT_FAILURE),
                "no output");
}
