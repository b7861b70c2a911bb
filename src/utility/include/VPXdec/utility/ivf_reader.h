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

// Reader for the IVF container, as written by libvpx's tools: a 32 byte file header followed by
// frames, each with a 12 byte header.
//
#ifndef VD_VPXDEC_UTILITY_IVF_READER_H
#define VD_VPXDEC_UTILITY_IVF_READER_H

#include <VPXdec/media/types.h>

#include <cstdint>
#include <istream>
#include <memory>
#include <string_view>
#include <vector>

namespace vpxdec::utility {

struct IvfHeader
{
    char fourcc[4] = {};
    uint16_t width = 0;
    uint16_t height = 0;
    uint32_t frameRate = 0;
    uint32_t timeScale = 0;
    uint32_t frameCount = 0;
};

class IvfReader
{
public:
    static constexpr uint32_t kFileHeaderSize = 32;
    static constexpr uint32_t kFrameHeaderSize = 12;
    // Larger frame sizes are taken to be a corrupt header.
    static constexpr uint32_t kMaxFrameSize = 256 * 1024 * 1024;

    const IvfHeader& header() const { return m_header; }

    // VP8 or VP9 from the fourcc, or Unknown.
    CodecId codec() const;

    // Read the next frame. Returns false at the end of the stream, or on a truncated frame.
    bool read(std::vector<uint8_t>& payload, int64_t& timestamp);

    uint32_t framesRead() const { return m_framesRead; }

    // Byte offset in stream
    uint64_t offset() const;

private:
    explicit IvfReader(std::unique_ptr<std::istream> stream);

    friend std::unique_ptr<IvfReader> createIvfReader(std::unique_ptr<std::istream> stream);

    bool readHeader();

    std::unique_ptr<std::istream> m_stream;
    IvfHeader m_header;
    uint32_t m_framesRead = 0;
};

/*!
 * \brief Create an IvfReader, given a filename
 *
 * @param[in]       name Filename of IVF file
 * @return          Unique ptr to the new IvfReader, or nullptr if failed
 */
std::unique_ptr<IvfReader> createIvfReader(std::string_view name);

/*!
 * \brief Create an IvfReader, given an istream
 *
 * @param[in]       stream  Stream positioned at the IVF file header - will take ownership
 * @return          Unique ptr to the new IvfReader, or nullptr if the header is not valid
 */
std::unique_ptr<IvfReader> createIvfReader(std::unique_ptr<std::istream> stream);

} // namespace vpxdec::utility

#endif // VD_VPXDEC_UTILITY_IVF_READER_H
