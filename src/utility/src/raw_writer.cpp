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
#include <VPXdec/utility/raw_writer.h>
#include <VPXdec/utility/types_fmt.h>
//
#include <fmt/core.h>
//
#include <fstream>
#include <ios>
#include <string>

namespace vpxdec::utility {

RawWriter::RawWriter(const FrameDescriptor& description, std::unique_ptr<std::ostream> stream)
    : m_description(description)
    , m_stream(std::move(stream))
{}

uint64_t RawWriter::offset() const { return static_cast<uint64_t>(m_stream->tellp()); }

bool RawWriter::write(const Frame& frame)
{
    const FrameDescriptor& desc = frame.descriptor();

    if (m_description.format == PixelFormat::Unknown) {
        // If the current description was unknown, initialize from first frame
        m_description = desc;
    } else if (desc.format != m_description.format || desc.width != m_description.width ||
               desc.height != m_description.height) {
        fmt::print(stderr, "Frame {} does not match output {}\n", desc, m_description);
        return false;
    }

    if (!frame.hasBuffer()) {
        return false;
    }

    for (uint32_t plane = 0; plane < frame.planeCount(); ++plane) {
        const uint8_t* data = frame.planeData(plane);
        const size_t rowSize = FrameLayout::rowSize(desc.format, plane, desc.width);
        const uint32_t height = FrameLayout::planeHeight(desc.format, plane, desc.height);
        const size_t stride = frame.planeStride(plane);

        for (uint32_t row = 0; row < height; ++row) {
            m_stream->write(static_cast<const char*>(static_cast<const void*>(data + row * stride)),
                            static_cast<std::streamsize>(rowSize));
            if (!m_stream->good()) {
                return false;
            }
        }
    }

    return true;
}

bool RawWriter::write(const std::vector<uint8_t>& memory)
{
    m_stream->write(static_cast<const char*>(static_cast<const void*>(memory.data())),
                    static_cast<std::streamsize>(memory.size()));

    return m_stream->good();
}

std::unique_ptr<RawWriter> createRawWriter(const FrameDescriptor& description, std::string_view name)
{
    if (name.empty()) {
        return nullptr;
    }

    std::unique_ptr<std::ostream> stream =
        std::make_unique<std::ofstream>(std::string(name), std::ios::binary);
    if (!stream->good()) {
        return nullptr;
    }

    return std::unique_ptr<RawWriter>(new RawWriter(description, std::move(stream)));
}

std::unique_ptr<RawWriter> createRawWriter(std::string_view name)
{
    return createRawWriter(FrameDescriptor{}, name);
}

std::unique_ptr<RawWriter> createRawWriter(const FrameDescriptor& description,
                                           std::unique_ptr<std::ostream> stream)
{
    if (!stream || !stream->good()) {
        return nullptr;
    }

    return std::unique_ptr<RawWriter>(new RawWriter(description, std::move(stream)));
}

} // namespace vpxdec::utility
