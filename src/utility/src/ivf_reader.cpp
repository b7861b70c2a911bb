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

#include <VPXdec/utility/byte_order.h>
#include <VPXdec/utility/ivf_reader.h>
#include <VPXdec/utility/types_convert.h>
//
#include <fmt/core.h>
//
#include <cstring>
#include <fstream>
#include <string>

namespace vpxdec::utility {

namespace {
    constexpr char kSignature[4] = {'D', 'K', 'I', 'F'};
} // namespace

IvfReader::IvfReader(std::unique_ptr<std::istream> stream)
    : m_stream(std::move(stream))
{}

bool IvfReader::readHeader()
{
    uint8_t bytes[kFileHeaderSize] = {};
    if (!m_stream->read(static_cast<char*>(static_cast<void*>(bytes)), sizeof(bytes))) {
        fmt::print(stderr, "Short IVF header.\n");
        return false;
    }

    if (std::memcmp(bytes, kSignature, sizeof(kSignature)) != 0) {
        fmt::print(stderr, "Bad IVF signature.\n");
        return false;
    }

    const uint16_t version = loadLittleEndian<uint16_t>(bytes + 4);
    const uint16_t headerSize = loadLittleEndian<uint16_t>(bytes + 6);
    if (version != 0) {
        fmt::print(stderr, "Unrecognized IVF version {}.\n", version);
        return false;
    }

    std::memcpy(m_header.fourcc, bytes + 8, sizeof(m_header.fourcc));
    m_header.width = loadLittleEndian<uint16_t>(bytes + 12);
    m_header.height = loadLittleEndian<uint16_t>(bytes + 14);
    m_header.frameRate = loadLittleEndian<uint32_t>(bytes + 16);
    m_header.timeScale = loadLittleEndian<uint32_t>(bytes + 20);
    m_header.frameCount = loadLittleEndian<uint32_t>(bytes + 24);

    // Skip any header extension.
    if (headerSize > kFileHeaderSize) {
        m_stream->ignore(headerSize - kFileHeaderSize);
        if (!m_stream->good()) {
            fmt::print(stderr, "Short IVF header.\n");
            return false;
        }
    }

    return true;
}

CodecId IvfReader::codec() const
{
    CodecId id = CodecId::Unknown;
    fromString(std::string_view(m_header.fourcc, sizeof(m_header.fourcc)), id);
    return id;
}

bool IvfReader::read(std::vector<uint8_t>& payload, int64_t& timestamp)
{
    uint32_t size = 0;
    if (!readLittleEndian(*m_stream, size)) {
        // End of file
        return false;
    }

    uint64_t pts = 0;
    if (!readLittleEndian(*m_stream, pts)) {
        fmt::print(stderr, "Short IVF frame header.\n");
        return false;
    }

    if (size > kMaxFrameSize) {
        fmt::print(stderr, "IVF frame of {} bytes is too large.\n", size);
        return false;
    }

    payload.resize(size);
    char* data = static_cast<char*>(static_cast<void*>(payload.data()));
    if (!m_stream->read(data, static_cast<std::streamsize>(size))) {
        fmt::print(stderr, "Short IVF frame.\n");
        return false;
    }

    timestamp = static_cast<int64_t>(pts);
    m_framesRead++;
    return true;
}

uint64_t IvfReader::offset() const { return static_cast<uint64_t>(m_stream->tellg()); }

std::unique_ptr<IvfReader> createIvfReader(std::unique_ptr<std::istream> stream)
{
    if (!stream || !stream->good()) {
        return nullptr;
    }

    std::unique_ptr<IvfReader> reader(new IvfReader(std::move(stream)));
    if (!reader->readHeader()) {
        return nullptr;
    }

    return reader;
}

std::unique_ptr<IvfReader> createIvfReader(std::string_view name)
{
    auto stream = std::make_unique<std::ifstream>(std::string(name), std::ios::binary);
    if (!stream->good()) {
        fmt::print(stderr, "Cannot open IVF file {}\n", name);
        return nullptr;
    }

    return createIvfReader(std::move(stream));
}

} // namespace vpxdec::utility
