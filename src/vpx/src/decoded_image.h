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

#ifndef VD_VPXDEC_VPX_DECODED_IMAGE_H
#define VD_VPXDEC_VPX_DECODED_IMAGE_H

#include <VPXdec/media/buffer.h>
#include <VPXdec/media/frame.h>
#include <VPXdec/media/frame_descriptor.h>
#include <VPXdec/media/types.h>
//
#include <vpx/vpx_image.h>

#include <cstdint>
#include <memory>

namespace vpxdec::decoder {

// The zero-copy form of an image: the buffer it lives in (one extra reference) and where each
// plane sits in it.
struct SharedImage
{
    std::shared_ptr<Buffer> buffer;
    PlaneLayouts planes = {};
    FrameDescriptor desc;
};

// Wraps one decoded image. The vpx_image_t is copied, but the pixels it points to still belong
// to the codec context: use the image before the next decode or destroy call.
class VpxImage
{
public:
    explicit VpxImage(const vpx_image_t& image)
        : m_image(image)
    {}

    // True if the pixels live in a buffer acquired through the frame buffer callbacks.
    bool hasExternalBuffer() const { return m_image.fb_priv != nullptr; }

    ReturnCode descriptor(FrameDescriptor& descOut) const;

    // Copy every plane into a newly allocated frame.
    ReturnCode toOwnedFrame(Frame& frameOut) const;

    // Find the planes inside the external buffer. Fails with IntegrityError if any plane starts
    // outside it, in which case `sharedOut` is untouched and no reference is taken.
    ReturnCode toSharedBuffer(SharedImage& sharedOut) const;

    // libvpx plane index holding our plane `plane` (YV12 stores V before U).
    static int vpxPlaneIndex(PixelFormat format, uint32_t plane);

private:
    vpx_image_t m_image;
};

} // namespace vpxdec::decoder

#endif // VD_VPXDEC_VPX_DECODED_IMAGE_H
