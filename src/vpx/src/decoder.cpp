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

#include "decoder.h"

#include "decoder_config.h"
#include "frame_buffer_bridge.h"

#include <VPXdec/common/log.h>
#include <VPXdec/vpx/vpx_decoder.h>

#include <climits>
#include <memory>
#include <new>
#include <utility>

namespace vpxdec::decoder {

static const LogComponent kComp = LogComponent::Decoder;

// - VpxDecoder -----------------------------------------------------------------------------------

VpxDecoder::VpxDecoder(CodecId id, std::shared_ptr<CodecInterface> codec)
    : m_id(id)
    , m_codec(std::move(codec))
{}

VpxDecoder::~VpxDecoder() { release(); }

ReturnCode VpxDecoder::initialize(const VideoDecoderParameters& params, const DecoderOptions* options)
{
    if (m_state != State::Uninitialized) {
        VDLogError("Decoder already initialized\n");
        return ReturnCode::Error;
    }

    switch (m_id) {
        case CodecId::VP8: m_name = kVp8DecoderName; break;
        case CodecId::VP9: m_name = kVp9DecoderName; break;
        default:
            VDLogError("Unsupported codec %d\n", static_cast<int>(m_id));
            return ReturnCode::UnsupportedCodec;
    }
    if (!m_codec) {
        VDLogError("No codec interface\n");
        return ReturnCode::InvalidParam;
    }

    DecoderConfig config;
    std::string rejected;
    if (options && !options->applyTo(config, &rejected)) {
        VDLogError("Unknown option, or wrong type for option: %s\n", rejected.c_str());
        return ReturnCode::InvalidParam;
    }
    if (!config.validate()) {
        return ReturnCode::InvalidParam;
    }
    config.initialiseLogs();

    vpx_codec_dec_cfg_t cfg{};
    cfg.threads = static_cast<unsigned int>(config.getThreads());
    cfg.w = params.width;
    cfg.h = params.height;

    const vpx_codec_err_t err = m_codec->init(&m_ctx, m_id, &cfg);
    if (err != VPX_CODEC_OK) {
        m_lastError = m_codec->errorString(&m_ctx, err);
        VDLogError("%.*s init failed: %s\n", static_cast<int>(m_name.size()), m_name.data(),
                   m_lastError.c_str());
        return ReturnCode::DecodeError;
    }
    m_contextInitialized = true;

    try {
        m_bufferPool = std::make_shared<BufferPool>(0);
    } catch (const std::bad_alloc&) {
        VDLogError("Failed to allocate buffer pool\n");
        release();
        return ReturnCode::Error;
    }

    // Only VP9 can decode into caller supplied buffers.
    if (m_id == CodecId::VP9 && config.getExternalBuffers()) {
        const vpx_codec_err_t fbErr = m_codec->setFrameBufferFunctions(
            &m_ctx, vpxdecGetFrameBuffer, vpxdecReleaseFrameBuffer, m_bufferPool.get());
        if (fbErr == VPX_CODEC_OK) {
            m_externalBuffers = true;
        } else {
            m_lastError = m_codec->errorString(&m_ctx, fbErr);
            VDLogWarning("Decoding into internal buffers, frame buffer callbacks refused: %s\n",
                         m_lastError.c_str());
        }
    }

    VDLogInfo("Created %.*s, threads %d, external buffers %s\n", static_cast<int>(m_name.size()),
              m_name.data(), config.getThreads(), m_externalBuffers ? "on" : "off");
    m_state = State::Ready;
    return ReturnCode::Success;
}

void VpxDecoder::release()
{
    if (m_state == State::Destroyed) {
        return;
    }

    // Context first: destroying it may call back into the bridge to release frame buffers.
    if (m_contextInitialized) {
        const vpx_codec_err_t err = m_codec->destroy(&m_ctx);
        if (err != VPX_CODEC_OK) {
            VDLogWarning("Codec destroy reported: %s\n", m_codec->errorString(nullptr, err).c_str());
        }
        m_contextInitialized = false;
    }
    m_iter = nullptr;
    m_bufferPool.reset();
    m_state = State::Destroyed;
}

ReturnCode VpxDecoder::configure(const VideoDecoderParameters* /*params*/,
                                 const DecoderOptions* /*options*/)
{
    // Parameters are fixed at construction.
    return ReturnCode::Success;
}

ReturnCode VpxDecoder::setOption(std::string_view /*name*/, const OptionValue& /*value*/)
{
    return ReturnCode::Success;
}

ReturnCode VpxDecoder::sendPacket(const Packet& packet)
{
    if (!isActive()) {
        return ReturnCode::Uninitialized;
    }
    if (packet.empty()) {
        return flush();
    }
    if (packet.size > UINT_MAX) {
        VDLogError("Packet of %zu bytes is too large\n", packet.size);
        return ReturnCode::InvalidParam;
    }
    return decode(packet.data, packet.size);
}

ReturnCode VpxDecoder::flush()
{
    if (!isActive()) {
        return ReturnCode::Uninitialized;
    }
    VDLogDebug("Flush\n");
    return decode(nullptr, 0);
}

ReturnCode VpxDecoder::decode(const uint8_t* data, size_t size)
{
    const vpx_codec_err_t err = m_codec->decode(&m_ctx, data, static_cast<unsigned int>(size));

    // Each decode call starts a fresh run of output images.
    m_iter = nullptr;

    if (err != VPX_CODEC_OK) {
        m_lastError = m_codec->errorString(&m_ctx, err);
        VDLogError("Decode of %zu bytes failed: %s\n", size, m_lastError.c_str());
        m_state = State::Ready;
        return ReturnCode::DecodeError;
    }
    m_state = State::Decoding;
    return ReturnCode::Success;
}

ReturnCode VpxDecoder::receiveFrame(const std::shared_ptr<FramePool>& pool,
                                    std::shared_ptr<Frame>& frameOut)
{
    if (!isActive()) {
        return ReturnCode::Uninitialized;
    }

    const vpx_image_t* img = m_codec->getFrame(&m_ctx, &m_iter);
    if (img == nullptr) {
        m_state = State::Ready;
        return ReturnCode::Again;
    }
    m_state = State::Decoding;

    const VpxImage image(*img);
    if (!pool) {
        return receiveUnpooled(image, frameOut);
    }
    return receivePooled(image, *pool, frameOut);
}

ReturnCode VpxDecoder::receiveUnpooled(const VpxImage& image, std::shared_ptr<Frame>& frameOut) const
{
    std::shared_ptr<Frame> frame;
    try {
        frame = std::make_shared<Frame>();
    } catch (const std::bad_alloc&) {
        VDLogError("Failed to allocate frame\n");
        return ReturnCode::Error;
    }

    if (!image.hasExternalBuffer()) {
        if (const ReturnCode res = image.toOwnedFrame(*frame); res != ReturnCode::Success) {
            return res;
        }
    } else {
        SharedImage shared;
        if (const ReturnCode res = image.toSharedBuffer(shared); res != ReturnCode::Success) {
            return res;
        }
        if (const ReturnCode res =
                frame->attachSharedBuffer(shared.desc, std::move(shared.buffer), shared.planes);
            res != ReturnCode::Success) {
            return res;
        }
    }

    frameOut = std::move(frame);
    return ReturnCode::Success;
}

ReturnCode VpxDecoder::receivePooled(const VpxImage& image, FramePool& pool,
                                     std::shared_ptr<Frame>& frameOut)
{
    std::shared_ptr<Frame> pooled;

    if (!image.hasExternalBuffer()) {
        FrameDescriptor desc;
        if (const ReturnCode res = image.descriptor(desc); res != ReturnCode::Success) {
            return res;
        }
        if (!m_framePoolInitialized.load(std::memory_order_relaxed)) {
            if (const ReturnCode res = pool.configure(desc); res != ReturnCode::Success) {
                return res;
            }
            m_framePoolInitialized.store(true, std::memory_order_relaxed);
        }

        Frame owned;
        if (const ReturnCode res = image.toOwnedFrame(owned); res != ReturnCode::Success) {
            return res;
        }
        if (const ReturnCode res = pool.getFrame(desc, pooled); res != ReturnCode::Success) {
            return res;
        }
        if (!pooled->hasBuffer()) {
            if (const ReturnCode res = pooled->allocate(desc); res != ReturnCode::Success) {
                return res;
            }
        }
        if (const ReturnCode res = owned.copyTo(*pooled); res != ReturnCode::Success) {
            return res;
        }
    } else {
        SharedImage shared;
        if (const ReturnCode res = image.toSharedBuffer(shared); res != ReturnCode::Success) {
            return res;
        }
        if (!m_framePoolInitialized.load(std::memory_order_relaxed)) {
            if (const ReturnCode res =
                    pool.configure(shared.desc, std::make_unique<EmptyFrameCreator>());
                res != ReturnCode::Success) {
                return res;
            }
            m_framePoolInitialized.store(true, std::memory_order_relaxed);
        }

        if (const ReturnCode res = pool.getFrame(shared.desc, pooled); res != ReturnCode::Success) {
            return res;
        }
        if (const ReturnCode res =
                pooled->attachSharedBuffer(shared.desc, std::move(shared.buffer), shared.planes);
            res != ReturnCode::Success) {
            return res;
        }
    }

    frameOut = std::move(pooled);
    return ReturnCode::Success;
}

ReturnCode VpxDecoder::receiveFrameBorrowed(const Frame*& /*frameOut*/)
{
    VDLogDebug("Borrowed frames are not supported\n");
    return ReturnCode::NotSupported;
}

// ------------------------------------------------------------------------------------------------

ReturnCode createVpxDecoder(CodecId id, const VideoDecoderParameters& params,
                            const DecoderOptions* options,
                            std::unique_ptr<VideoDecoder>& decoderOut,
                            std::shared_ptr<CodecInterface> codec)
{
    if (!codec) {
        codec = createLibVpxInterface();
    }

    std::unique_ptr<VpxDecoder> decoder;
    try {
        decoder = std::make_unique<VpxDecoder>(id, std::move(codec));
    } catch (const std::bad_alloc&) {
        VDLogError("Failed to allocate decoder\n");
        return ReturnCode::Error;
    }
    if (const ReturnCode res = decoder->initialize(params, options); res != ReturnCode::Success) {
        return res;
    }

    decoderOut = std::move(decoder);
    return ReturnCode::Success;
}

} // namespace vpxdec::decoder
