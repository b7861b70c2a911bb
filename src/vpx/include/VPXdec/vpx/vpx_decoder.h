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

// VP8 and VP9 decoding through libvpx, behind the VideoDecoder contract.
//
#ifndef VD_VPXDEC_VPX_VPX_DECODER_H
#define VD_VPXDEC_VPX_VPX_DECODER_H

#include <VPXdec/media/decoder_registry.h>
#include <VPXdec/media/types.h>
#include <VPXdec/media/video_decoder.h>
#include <VPXdec/vpx/codec_interface.h>

#include <cstddef>
#include <memory>
#include <string_view>

namespace vpxdec::decoder {

constexpr std::string_view kVp8DecoderName = "vp8-dec";
constexpr std::string_view kVp9DecoderName = "vp9-dec";

// Create and initialise a decoder for VP8 or VP9 (anything else is UnsupportedCodec). Options are
// those of DecoderConfig: threads, external_buffers, log_level, log_level_<component>,
// log_stdout and log_timestamp_precision. A null `codec` means libvpx.
ReturnCode createVpxDecoder(CodecId id, const VideoDecoderParameters& params,
                            const DecoderOptions* options,
                            std::unique_ptr<VideoDecoder>& decoderOut,
                            std::shared_ptr<CodecInterface> codec = nullptr);

// Register the vp8-dec and vp9-dec builders. Returns how many were newly registered, so a second
// call on the same registry registers nothing.
size_t registerVpxDecoders(DecoderRegistry& registry);

// Register with the process-wide registry. Only the first call does anything.
void registerVpxDecoders();

} // namespace vpxdec::decoder

#endif // VD_VPXDEC_VPX_VPX_DECODER_H
