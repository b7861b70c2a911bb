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

#include <VPXdec/media/frame_layout.h>
#include <VPXdec/utility/frame_hash.h>
//
#include <fmt/core.h>
#include <xxhash.h>
//
#include <new>

namespace vpxdec::utility {

FrameHash::FrameHash()
    : m_state(XXH64_createState())
{
    if (!m_state) {
        throw std::bad_alloc();
    }
    XXH64_reset(m_state, 0);
}

FrameHash::~FrameHash() { XXH64_freeState(m_state); }

void FrameHash::reset() { XXH64_reset(m_state, 0); }

void FrameHash::update(const uint8_t* data, size_t size) { XXH64_update(m_state, data, size); }

void FrameHash::updateFrame(const Frame& frame)
{
    for (uint32_t plane = 0; plane < frame.planeCount(); ++plane) {
        updatePlane(frame, plane);
    }
}

void FrameHash::updatePlane(const Frame& frame, uint32_t plane)
{
    const FrameDescriptor& desc = frame.descriptor();
    const uint8_t* data = frame.planeData(plane);
    if (data == nullptr) {
        return;
    }
    const size_t rowSize = FrameLayout::rowSize(desc.format, plane, desc.width);
    const uint32_t height = FrameLayout::planeHeight(desc.format, plane, desc.height);
    const size_t stride = frame.planeStride(plane);

    for (uint32_t row = 0; row < height; ++row) {
        update(data + row * stride, rowSize);
    }
}

uint64_t FrameHash::digest() const { return XXH64_digest(m_state); }

std::string FrameHash::hexDigest() const { return fmt::format("{:016x}", digest()); }

} // namespace vpxdec::utility
