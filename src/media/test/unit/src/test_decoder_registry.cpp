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

#include <VPXdec/media/decoder_registry.h>
//
#include <gtest/gtest.h>
//
#include <memory>
#include <string>

using namespace vpxdec;

namespace {

class NullDecoder : public VideoDecoder
{
public:
    explicit NullDecoder(CodecId id)
        : m_id(id)
    {}

    CodecId id() const override { return m_id; }
    std::string_view name() const override { return "null"; }
    ReturnCode configure(const VideoDecoderParameters*, const DecoderOptions*) override
    {
        return ReturnCode::Success;
    }
    ReturnCode setOption(std::string_view, const OptionValue&) override
    {
        return ReturnCode::Success;
    }
    ReturnCode sendPacket(const Packet&) override { return ReturnCode::Success; }
    ReturnCode receiveFrame(const std::shared_ptr<FramePool>&, std::shared_ptr<Frame>&) override
    {
        return ReturnCode::Again;
    }
    ReturnCode receiveFrameBorrowed(const Frame*&) override { return ReturnCode::NotSupported; }
    ReturnCode flush() override { return ReturnCode::Success; }

private:
    CodecId m_id;
};

class NamedBuilder : public VideoDecoderBuilder
{
public:
    NamedBuilder(CodecId id, std::string name)
        : m_id(id)
        , m_name(std::move(name))
    {}

    CodecId id() const override { return m_id; }
    std::string_view name() const override { return m_name; }
    ReturnCode createDecoder(CodecId id, const VideoDecoderParameters&, const DecoderOptions*,
                             std::unique_ptr<VideoDecoder>& decoderOut) const override
    {
        decoderOut = std::make_unique<NullDecoder>(id);
        return ReturnCode::Success;
    }

private:
    CodecId m_id;
    std::string m_name;
};

// Accepts anything whose name starts with "ok".
struct OptionSink
{
    bool set(const char* name, const bool&) { return std::string(name).rfind("ok", 0) == 0; }
    bool set(const char* name, const int32_t& val)
    {
        lastInt = val;
        return std::string(name).rfind("ok", 0) == 0;
    }
    bool set(const char* name, const std::string&) { return std::string(name).rfind("ok", 0) == 0; }

    int32_t lastInt = 0;
};

} // namespace

TEST(DecoderRegistry, FindsByIdAndName)
{
    DecoderRegistry registry;
    EXPECT_TRUE(registry.registerDecoder(std::make_shared<NamedBuilder>(CodecId::VP8, "a"), false));
    EXPECT_TRUE(registry.registerDecoder(std::make_shared<NamedBuilder>(CodecId::VP9, "b"), false));

    ASSERT_NE(registry.findDecoder(CodecId::VP9), nullptr);
    EXPECT_EQ(registry.findDecoder(CodecId::VP9)->name(), "b");
    EXPECT_EQ(registry.findDecoder("a")->id(), CodecId::VP8);
    EXPECT_EQ(registry.findDecoder(CodecId::AV1), nullptr);
    EXPECT_EQ(registry.findDecoder("c"), nullptr);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(DecoderRegistry, DuplicateNamesAreNotRegistered)
{
    DecoderRegistry registry;
    EXPECT_TRUE(registry.registerDecoder(std::make_shared<NamedBuilder>(CodecId::VP8, "a"), false));
    EXPECT_FALSE(registry.registerDecoder(std::make_shared<NamedBuilder>(CodecId::VP8, "a"), true));
    EXPECT_FALSE(registry.registerDecoder(nullptr, false));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(DecoderRegistry, PreferredBuilderComesFirst)
{
    DecoderRegistry registry;
    registry.registerDecoder(std::make_shared<NamedBuilder>(CodecId::VP9, "plain"), false);
    registry.registerDecoder(std::make_shared<NamedBuilder>(CodecId::VP9, "fast"), true);
    EXPECT_EQ(registry.findDecoder(CodecId::VP9)->name(), "fast");
}

TEST(DecoderRegistry, CreateDecoder)
{
    DecoderRegistry registry;
    registry.registerDecoder(std::make_shared<NamedBuilder>(CodecId::VP8, "a"), false);

    std::unique_ptr<VideoDecoder> decoder;
    EXPECT_EQ(registry.createDecoder(CodecId::VP8, {}, nullptr, decoder), ReturnCode::Success);
    ASSERT_NE(decoder, nullptr);
    EXPECT_EQ(decoder->id(), CodecId::VP8);

    std::unique_ptr<VideoDecoder> missing;
    EXPECT_EQ(registry.createDecoder(CodecId::H264, {}, nullptr, missing), ReturnCode::NotFound);
    EXPECT_EQ(missing, nullptr);
}

TEST(DecoderOptions, AppliedInOrderUntilRejected)
{
    DecoderOptions options;
    options.set("ok_int", int32_t{3}).set("bad_flag", true).set("ok_late", int32_t{9});

    OptionSink sink;
    std::string rejected;
    EXPECT_FALSE(options.applyTo(sink, &rejected));
    EXPECT_EQ(rejected, "bad_flag");
    EXPECT_EQ(sink.lastInt, 3);

    DecoderOptions good;
    good.set("ok_text", std::string("x"));
    EXPECT_TRUE(good.applyTo(sink));
}
