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

#ifndef VD_VPXDEC_VPX_DECODER_H
#define VD_VPXDEC_VPX_DECODER_H

#include "decoded_image.h"

#include <VPXdec/common/class_utils.hpp>
#include <VPXdec/media/buffer.h>
#include <VPXdec/media/frame.h>
#include <VPXdec/media/frame_pool.h>
#include <VPXdec/media/video_decoder.h>
#include <VPXdec/vpx/codec_interface.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vpxdec::decoder {

// Pool frame creator that allocates nothing: the pixels come from attached shared buffers.
class EmptyFrameCreator : public FrameCreator
{
public:
    ReturnCode createFrame(const FrameDescriptor& desc, Frame& frame) const override
    {
        return frame.createEmpty(desc);
    }
};

// - VpxDecoder -----------------------------------------------------------------------------------

// Drives one libvpx codec context.
//
// Uninitialized -> Ready        initialize()
// Ready         -> Decoding     sendPacket(), flush()
// Decoding      -> Decoding     receiveFrame() returned a frame
// Decoding      -> Ready        receiveFrame() returned Again, or a decode call failed
// any           -> Destroyed    release() (also run by the destructor)
//
// For VP9 the decoder writes its output into buffers from m_bufferPool, so frames can share that
// memory instead of copying it. The pool is released only after the codec context, which may
// still hand buffers back while it is torn down.
class VpxDecoder : public VideoDecoder
{
public:
    enum class State
    {
        Uninitialized,
        Ready,
        Decoding,
        Destroyed,
    };

    VpxDecoder(CodecId id, std::shared_ptr<CodecInterface> codec);
    ~VpxDecoder() override;
    VDNoCopyNoMove(VpxDecoder);

    ReturnCode initialize(const VideoDecoderParameters& params, const DecoderOptions* options);
    void release();

    CodecId id() const override { return m_id; }
    std::string_view name() const override { return m_name; }

    ReturnCode configure(const VideoDecoderParameters* params, const DecoderOptions* options) override;
    ReturnCode setOption(std::string_view name, const OptionValue& value) override;

    ReturnCode sendPacket(const Packet& packet) override;
    ReturnCode receiveFrame(const std::shared_ptr<FramePool>& pool,
                            std::shared_ptr<Frame>& frameOut) override;
    ReturnCode receiveFrameBorrowed(const Frame*& frameOut) override;
    ReturnCode flush() override;

    State state() const { return m_state; }
    const std::string& lastError() const { return m_lastError; }
    bool usesExternalBuffers() const { return m_externalBuffers; }
    const std::shared_ptr<BufferPool>& bufferPool() const { return m_bufferPool; }

private:
    bool isActive() const { return m_state == State::Ready || m_state == State::Decoding; }

    ReturnCode decode(const uint8_t* data, size_t size);
    ReturnCode receiveUnpooled(const VpxImage& image, std::shared_ptr<Frame>& frameOut) const;
    ReturnCode receivePooled(const VpxImage& image, FramePool& pool,
                             std::shared_ptr<Frame>& frameOut);

    CodecId m_id;
    std::string_view m_name;
    std::shared_ptr<CodecInterface> m_codec;

    vpx_codec_ctx_t m_ctx{};
    vpx_codec_iter_t m_iter = nullptr;
    bool m_contextInitialized = false;
    bool m_externalBuffers = false;

    std::shared_ptr<BufferPool> m_bufferPool;
    std::atomic<bool> m_framePoolInitialized{false};

    State m_state = State::Uninitialized;
    std::string m_lastError;
};

} // namespace vpxdec::decoder

#endif // VD_VPXDEC_VPX_DECODER_H
