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

#include <VPXdec/vpx/codec_interface.h>
//
#include <vpx/vp8dx.h>
#include <vpx/vpx_decoder.h>

#include <memory>
#include <string>

namespace vpxdec::decoder {

namespace {

    vpx_codec_iface_t* decoderInterface(CodecId id)
    {
        switch (id) {
            case CodecId::VP8: return vpx_codec_vp8_dx();
            case CodecId::VP9: return vpx_codec_vp9_dx();
            default: break;
        }
        return nullptr;
    }

} // namespace

class CodecInterfaceLibVpx : public CodecInterface
{
public:
    vpx_codec_err_t init(vpx_codec_ctx_t* ctx, CodecId id, const vpx_codec_dec_cfg_t* cfg) override
    {
        vpx_codec_iface_t* iface = decoderInterface(id);
        if (iface == nullptr) {
            return VPX_CODEC_INCAPABLE;
        }
        return vpx_codec_dec_init_ver(ctx, iface, cfg, 0, VPX_DECODER_ABI_VERSION);
    }

    vpx_codec_err_t decode(vpx_codec_ctx_t* ctx, const uint8_t* data, unsigned int size) override
    {
        return vpx_codec_decode(ctx, data, size, nullptr, 0);
    }

    vpx_image_t* getFrame(vpx_codec_ctx_t* ctx, vpx_codec_iter_t* iter) override
    {
        return vpx_codec_get_frame(ctx, iter);
    }

    vpx_codec_err_t setFrameBufferFunctions(vpx_codec_ctx_t* ctx,
                                            vpx_get_frame_buffer_cb_fn_t getFn,
                                            vpx_release_frame_buffer_cb_fn_t releaseFn,
                                            void* priv) override
    {
        return vpx_codec_set_frame_buffer_functions(ctx, getFn, releaseFn, priv);
    }

    vpx_codec_err_t destroy(vpx_codec_ctx_t* ctx) override { return vpx_codec_destroy(ctx); }

    std::string errorString(const vpx_codec_ctx_t* ctx, vpx_codec_err_t err) const override
    {
        std::string message = vpx_codec_err_to_string(err);
        const char* detail = ctx ? vpx_codec_error_detail(ctx) : nullptr;
        if (detail != nullptr && detail[0] != '\0') {
            message += ": ";
            message += detail;
        }
        return message;
    }
};

std::unique_ptr<CodecInterface> createLibVpxInterface()
{
    return std::make_unique<CodecInterfaceLibVpx>();
}

} // namespace vpxdec::decoder
