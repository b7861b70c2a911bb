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

#include <VPXdec/common/log.h>
#include <VPXdec/vpx/vpx_decoder.h>

#include <memory>
#include <mutex>

namespace vpxdec::decoder {

static const LogComponent kComp = LogComponent::Registry;

namespace {

    class VpxDecoderBuilder : public VideoDecoderBuilder
    {
    public:
        VpxDecoderBuilder(CodecId id, std::string_view name)
            : m_id(id)
            , m_name(name)
        {}

        CodecId id() const override { return m_id; }
        std::string_view name() const override { return m_name; }

        ReturnCode createDecoder(CodecId id, const VideoDecoderParameters& params,
                                 const DecoderOptions* options,
                                 std::unique_ptr<VideoDecoder>& decoderOut) const override
        {
            return createVpxDecoder(id, params, options, decoderOut);
        }

    private:
        CodecId m_id;
        std::string_view m_name;
    };

} // namespace

size_t registerVpxDecoders(DecoderRegistry& registry)
{
    size_t registered = 0;
    if (registry.registerDecoder(std::make_shared<VpxDecoderBuilder>(CodecId::VP8, kVp8DecoderName),
                                 false)) {
        registered++;
    }
    if (registry.registerDecoder(std::make_shared<VpxDecoderBuilder>(CodecId::VP9, kVp9DecoderName),
                                 false)) {
        registered++;
    }
    return registered;
}

void registerVpxDecoders()
{
    static std::once_flag sOnce;
    std::call_once(sOnce, [] {
        const size_t registered = registerVpxDecoders(DecoderRegistry::instance());
        VDLogCustomFnName(LogLevel::Debug, "%zu vpx decoders registered\n",
                          "registerVpxDecoders", registered);
    });
}

} // namespace vpxdec::decoder
