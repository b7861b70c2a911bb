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

// The uniform decoder contract: every decoder implementation, whatever library it wraps, is
// driven through VideoDecoder and created through a VideoDecoderBuilder held by the registry.
//
#ifndef VD_VPXDEC_MEDIA_VIDEO_DECODER_H
#define VD_VPXDEC_MEDIA_VIDEO_DECODER_H

#include <VPXdec/media/frame.h>
#include <VPXdec/media/frame_pool.h>
#include <VPXdec/media/packet.h>
#include <VPXdec/media/types.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace vpxdec {

// Stream hints known before decoding starts. All optional.
struct VideoDecoderParameters
{
    uint32_t width = 0;
    uint32_t height = 0;
    PixelFormat format = PixelFormat::Unknown;
};

using OptionValue = std::variant<bool, int32_t, std::string>;

// Named options given to a decoder at construction, applied in insertion order.
class DecoderOptions
{
public:
    DecoderOptions() = default;

    DecoderOptions& set(std::string name, OptionValue value)
    {
        m_options.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    bool empty() const { return m_options.empty(); }
    size_t size() const { return m_options.size(); }

    // Push every option into `cfg` via cfg.set(name, value). Stops at, and reports, the first
    // option `cfg` rejects.
    template <typename C>
    bool applyTo(C& cfg, std::string* rejected = nullptr) const
    {
        for (const auto& option : m_options) {
            const char* name = option.first.c_str();
            const bool accepted =
                std::visit([&cfg, name](const auto& val) { return cfg.set(name, val); },
                           option.second);
            if (!accepted) {
                if (rejected) {
                    *rejected = option.first;
                }
                return false;
            }
        }
        return true;
    }

private:
    std::vector<std::pair<std::string, OptionValue>> m_options;
};

// - VideoDecoder ---------------------------------------------------------------------------------

// Stateful operations (sendPacket, receiveFrame, flush) must not run concurrently on one
// instance. An instance may be handed from one thread to another between calls.
class VideoDecoder
{
public:
    virtual ~VideoDecoder() = default;

    virtual CodecId id() const = 0;
    virtual std::string_view name() const = 0;

    virtual ReturnCode configure(const VideoDecoderParameters* params,
                                 const DecoderOptions* options) = 0;
    virtual ReturnCode setOption(std::string_view name, const OptionValue& value) = 0;

    // An empty packet is a flush.
    virtual ReturnCode sendPacket(const Packet& packet) = 0;

    // Returns Again when nothing is ready. With a pool, the frame comes from the pool.
    virtual ReturnCode receiveFrame(const std::shared_ptr<FramePool>& pool,
                                    std::shared_ptr<Frame>& frameOut) = 0;

    // A frame viewing decoder-owned memory, valid until the next call on the decoder.
    virtual ReturnCode receiveFrameBorrowed(const Frame*& frameOut) = 0;

    virtual ReturnCode flush() = 0;
};

// - VideoDecoderBuilder --------------------------------------------------------------------------

class VideoDecoderBuilder
{
public:
    virtual ~VideoDecoderBuilder() = default;

    virtual CodecId id() const = 0;
    virtual std::string_view name() const = 0;

    virtual ReturnCode createDecoder(CodecId id, const VideoDecoderParameters& params,
                                     const DecoderOptions* options,
                                     std::unique_ptr<VideoDecoder>& decoderOut) const = 0;
};

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_VIDEO_DECODER_H
