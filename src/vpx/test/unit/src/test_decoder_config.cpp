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

#include "decoder_config.h"
//
#include <gtest/gtest.h>
//
#include <cstdint>
#include <string>

using namespace vpxdec;
using namespace vpxdec::decoder;

class DecoderConfigFixture : public testing::Test
{
public:
    void TearDown() override
    {
        // Put the process-wide logger back the way other tests expect it.
        for (size_t comp = 0; comp < static_cast<size_t>(LogComponent::Count); ++comp) {
            sLog.setVerbosity(static_cast<LogComponent>(comp), LogLevel::Error);
        }
        sLog.setEnableStdout(false);
    }

    DecoderConfig config;
};

TEST_F(DecoderConfigFixture, Defaults)
{
    EXPECT_TRUE(config.validate());
    EXPECT_TRUE(config.getExternalBuffers());
    EXPECT_EQ(config.getThreads(), 0);
    EXPECT_EQ(config.getLogLevel(LogComponent::Decoder), LogLevel::Info);
}

TEST_F(DecoderConfigFixture, SetsByName)
{
    EXPECT_TRUE(config.set("threads", int32_t{8}));
    EXPECT_TRUE(config.set("external_buffers", false));
    EXPECT_EQ(config.getThreads(), 8);
    EXPECT_FALSE(config.getExternalBuffers());
    EXPECT_TRUE(config.validate());
}

TEST_F(DecoderConfigFixture, RejectsUnknownNamesAndWrongTypes)
{
    EXPECT_FALSE(config.set("thread", int32_t{8}));
    EXPECT_FALSE(config.set("threads", true));
    EXPECT_FALSE(config.set("threads", std::string("8")));
    EXPECT_FALSE(config.set("external_buffers", int32_t{1}));
    EXPECT_EQ(config.getThreads(), 0);
}

TEST_F(DecoderConfigFixture, ValidatesRanges)
{
    ASSERT_TRUE(config.set("log_level", int32_t{-1}));
    EXPECT_FALSE(config.validate());

    DecoderConfig tooVerbose;
    ASSERT_TRUE(tooVerbose.set("log_level", static_cast<int32_t>(LogLevel::Count)));
    EXPECT_FALSE(tooVerbose.validate());

    DecoderConfig badPrecision;
    ASSERT_TRUE(badPrecision.set("log_timestamp_precision", int32_t{7}));
    EXPECT_FALSE(badPrecision.validate());

    DecoderConfig badThreads;
    ASSERT_TRUE(badThreads.set("threads", int32_t{-4}));
    EXPECT_FALSE(badThreads.validate());
}

TEST_F(DecoderConfigFixture, PerComponentLogLevels)
{
    ASSERT_TRUE(config.set("log_level", static_cast<int32_t>(LogLevel::Warning)));
    ASSERT_TRUE(config.set("log_level_frame_pool", static_cast<int32_t>(LogLevel::Trace)));
    ASSERT_TRUE(config.set("log_level_buffer_pool", static_cast<int32_t>(LogLevel::Debug)));
    ASSERT_TRUE(config.set("log_level_decoder", static_cast<int32_t>(LogLevel::Fatal)));
    EXPECT_FALSE(config.set("log_level_framepool", int32_t{1}));

    EXPECT_EQ(config.getLogLevel(LogComponent::FramePool), LogLevel::Trace);
    EXPECT_EQ(config.getLogLevel(LogComponent::BufferPool), LogLevel::Debug);
    // The global level is a floor.
    EXPECT_EQ(config.getLogLevel(LogComponent::Decoder), LogLevel::Warning);
    EXPECT_EQ(config.getLogLevel(LogComponent::Bridge), LogLevel::Warning);

    ASSERT_TRUE(config.set("log_level_frame_pool", int32_t{42}));
    EXPECT_FALSE(config.validate());
}

TEST_F(DecoderConfigFixture, InitialiseLogsConfiguresLogger)
{
    ASSERT_TRUE(config.set("log_level", static_cast<int32_t>(LogLevel::Disabled)));
    ASSERT_TRUE(config.set("log_level_bridge", static_cast<int32_t>(LogLevel::Trace)));
    ASSERT_TRUE(config.set("log_stdout", true));
    config.initialiseLogs();

    EXPECT_EQ(sLog.getVerbosity(LogComponent::Bridge), LogLevel::Trace);
    EXPECT_EQ(sLog.getVerbosity(LogComponent::Decoder), LogLevel::Disabled);
    EXPECT_TRUE(sLog.getEnableStdout());
}
