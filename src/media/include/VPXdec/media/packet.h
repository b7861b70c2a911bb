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

#ifndef VD_VPXDEC_MEDIA_PACKET_H
#define VD_VPXDEC_MEDIA_PACKET_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vpxdec {

// A non-owning view of one compressed access unit. An empty packet asks the decoder to flush.
struct Packet
{
    const uint8_t* data = nullptr;
    size_t size = 0;
    int64_t timestamp = 0;

    bool empty() const { return data == nullptr || size == 0; }

    static Packet flush() { return Packet{}; }
    static Packet fromVector(const std::vector<uint8_t>& bytes, int64_t timestamp = 0)
    {
        return Packet{bytes.data(), bytes.size(), timestamp};
    }
};

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_PACKET_H
