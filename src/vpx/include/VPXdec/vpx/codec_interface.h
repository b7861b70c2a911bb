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

// Every call the decoder makes into libvpx goes through CodecInterface, so that the decoder can
// be driven by a synthetic implementation where no real bitstream is at hand.
//
#ifndef VD_VPXDEC_VPX_CODEC_INTERFACE_H
#define VD_VPXDEC_VPX_CODEC_INTERFACE_H

#include <VPXdec/media/types.h>
//
#include <vpx/vpx_decoder.h>
#include <vpx/vpx_frame_buffer.h>
#include <vpx/vpx_image.h>

#include <cstdint>
#include <memory>
#include <string>

namespace vpxdec::decoder {

class CodecInterface
{
public:
    virtual ~CodecInterface() = default;

    // Initialise `ctx` as a decoder for `id` with the library's decoder ABI version.
    virtual vpx_codec_err_t init(vpx_codec_ctx_t* ctx, CodecId id, const vpx_codec_dec_cfg_t* cfg) = 0;

    // A null `data` with zero `size` flushes.
    virtual vpx_codec_err_t decode(vpx_codec_ctx_t* ctx, const uint8_t* data, unsigned int size) = 0;

    // Next decoded image, or null when the images of the last decode call are used up.
    virtual vpx_image_t* getFrame(vpx_codec_ctx_t* ctx, vpx_codec_iter_t* iter) = 0;

    virtual vpx_codec_err_t setFrameBufferFunctions(vpx_codec_ctx_t* ctx,
                                                    vpx_get_frame_buffer_cb_fn_t getFn,
                                                    vpx_release_frame_buffer_cb_fn_t releaseFn,
                                                    void* priv) = 0;

    virtual vpx_codec_err_t destroy(vpx_codec_ctx_t* ctx) = 0;

    // Human readable description of `err`, with the context's detail message if it has one.
    virtual std::string errorString(const vpx_codec_ctx_t* ctx, vpx_codec_err_t err) const = 0;
};

std::unique_ptr<CodecInterface> createLibVpxInterface();

} // namespace vpxdec::decoder

#endif // VD_VPXDEC_VPX_CODEC_INTERFACE_H
