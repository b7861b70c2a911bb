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

// Reading and writing integers of a specific byte order from streams, independent of the host
// byte order.
//
#ifndef VD_VPXDEC_UTILITY_BYTE_ORDER_H
#define VD_VPXDEC_UTILITY_BYTE_ORDER_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <type_traits>

namespace vpxdec::utility {

// Assemble an integer from little-endian bytes.
template <typename T>
T loadLittleEndian(const uint8_t* bytes)
{
    static_assert(std::is_integral_v<T>);
    using U = std::make_unsigned_t<T>;
    U val = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        val = static_cast<U>(val | (static_cast<U>(bytes[i]) << (8 * i)));
    }
    return static_cast<T>(val);
}

template <typename T>
void storeLittleEndian(T val, uint8_t* bytes)
{
    static_assert(std::is_integral_v<T>);
    using U = std::make_unsigned_t<T>;
    const U uval = static_cast<U>(val);
    for (size_t i = 0; i < sizeof(T); ++i) {
        bytes[i] = static_cast<uint8_t>(uval >> (8 * i));
    }
}

// Read a little-endian value from a stream. Returns false on a short read.
template <typename T>
bool readLittleEndian(std::istream& stream, T& val)
{
    uint8_t bytes[sizeof(T)] = {};
    if (!stream.read(static_cast<char*>(static_cast<void*>(bytes)), sizeof(T))) {
        return false;
    }
    val = loadLittleEndian<T>(bytes);
    return true;
}

template <typename T>
bool writeLittleEndian(std::ostream& stream, T val)
{
    uint8_t bytes[sizeof(T)] = {};
    storeLittleEndian(val, bytes);
    return static_cast<bool>(stream.write(static_cast<char*>(static_cast<void*>(bytes)), sizeof(T)));
}

} // namespace vpxdec::utility

#endif // VD_VPXDEC_UTILITY_BYTE_ORDER_H
