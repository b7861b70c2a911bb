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

// The frame buffer callbacks handed to libvpx. They let the decoder write its output straight
// into buffers from a BufferPool.
//
// Ownership: `priv` passed to both callbacks is a borrowed BufferPool*. The decoder owns the pool
// and keeps it alive until after the codec context is destroyed. Each acquired frame buffer owns
// one reference to its Buffer, held by a heap allocated std::shared_ptr<Buffer> stored in
// fb->priv (and so in vpx_image_t::fb_priv). Acquire creates that reference and Release is the
// only place that drops it. Anything else reading fb_priv only borrows it.
//
#ifndef VD_VPXDEC_VPX_FRAME_BUFFER_BRIDGE_H
#define VD_VPXDEC_VPX_FRAME_BUFFER_BRIDGE_H

#include <VPXdec/media/buffer.h>
//
#include <vpx/vpx_frame_buffer.h>

#include <cstddef>
#include <memory>

namespace vpxdec::decoder {

// Returns 0 on success, and < 0 if no buffer of at least `minSize` bytes could be provided (fb
// is then left without data).
extern "C" int vpxdecGetFrameBuffer(void* priv, size_t minSize, vpx_codec_frame_buffer_t* fb);

// Drops the reference taken by vpxdecGetFrameBuffer. A null fb->priv is a no-op.
extern "C" int vpxdecReleaseFrameBuffer(void* priv, vpx_codec_frame_buffer_t* fb);

// The buffer behind an acquired frame buffer's private handle, without changing its reference
// count. Null for a null handle.
const std::shared_ptr<Buffer>* borrowFrameBuffer(const void* fbPriv);

} // namespace vpxdec::decoder

#endif // VD_VPXDEC_VPX_FRAME_BUFFER_BRIDGE_H
