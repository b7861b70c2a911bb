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

// 64 bit xxHash of decoded frames, accumulated across a stream.
//
#ifndef VD_VPXDEC_UTILITY_FRAME_HASH_H
#define VD_VPXDEC_UTILITY_FRAME_HASH_H

#include <VPXdec/common/class_utils.hpp>
#include <VPXdec/media/frame.h>

#include <cstddef>
#include <cstdint>
#include <string>

struct XXH64_state_s;

namespace vpxdec::utility {

class FrameHash
{
public:
    FrameHash();
    ~FrameHash();
    VDNoCopyNoMove(FrameHash);

    void reset();

    void update(const uint8_t* data, size_t size);

    // Accumulate the meaningful bytes of each row of each plane. Row padding is not hashed, so
    // the result does not depend on strides.
    void updateFrame(const Frame& frame);
    void updatePlane(const Frame& frame, uint32_t plane);

    uint64_t digest() const;

    // 16 lower case hex digits.
    std::string hexDigest() const;

private:
    XXH64_state_s* m_state;
};

} // namespace vpxdec::utility

#endif // VD_VPXDEC_UTILITY_FRAME_HASH_H
