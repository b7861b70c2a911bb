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

#include "frame_buffer_bridge.h"

#include <VPXdec/common/log.h>

#include <cstring>
#include <new>
#include <utility>

namespace vpxdec::decoder {

static const LogComponent kComp = LogComponent::Bridge;

using BufferRef = std::shared_ptr<Buffer>;

extern "C" int vpxdecGetFrameBuffer(void* priv, size_t minSize, vpx_codec_frame_buffer_t* fb)
{
    if (priv == nullptr || fb == nullptr) {
        VDLogError("Frame buffer requested without a pool\n");
        return -1;
    }
    fb->data = nullptr;
    fb->size = 0;
    fb->priv = nullptr;

    auto* pool = static_cast<BufferPool*>(priv);
    BufferRef buffer = pool->getBuffer(minSize);
    if (!buffer || buffer->size() < minSize) {
        VDLogError("No buffer of %zu bytes available\n", minSize);
        return -1;
    }

    auto* ref = new (std::nothrow) BufferRef(std::move(buffer));
    if (ref == nullptr) {
        VDLogError("Failed to allocate frame buffer handle\n");
        return -1;
    }

    // The decoder expects the memory it asked for to be zeroed.
    memset((*ref)->data(), 0, minSize);

    fb->data = (*ref)->data();
    fb->size = (*ref)->size();
    fb->priv = ref;
    VDLogTrace("Acquired %zu bytes (asked %zu), %zu buffers in pool\n", fb->size, minSize,
               pool->bufferCount());
    return 0;
}

extern "C" int vpxdecReleaseFrameBuffer(void* /*priv*/, vpx_codec_frame_buffer_t* fb)
{
    if (fb == nullptr || fb->priv == nullptr) {
        return 0;
    }
    delete static_cast<BufferRef*>(fb->priv);
    fb->priv = nullptr;
    return 0;
}

const std::shared_ptr<Buffer>* borrowFrameBuffer(const void* fbPriv)
{
    return static_cast<const BufferRef*>(fbPriv);
}

} // namespace vpxdec::decoder
