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

// Class for writing raw image files to streams or filesystem.
//
#ifndef VD_VPXDEC_UTILITY_RAW_WRITER_H
#define VD_VPXDEC_UTILITY_RAW_WRITER_H

#include <VPXdec/media/frame.h>
#include <VPXdec/media/frame_descriptor.h>

#include <cstdint>
#include <memory>
#include <ostream>
#include <string_view>
#include <vector>

namespace vpxdec::utility {

class RawWriter
{
public:
    // Information
    const FrameDescriptor& description() const { return m_description; }

    // Write the meaningful rows of every plane of a frame. Frames must match the description.
    bool write(const Frame& frame);

    // Write from memory
    bool write(const std::vector<uint8_t>& memory);

    // Byte offset in stream
    uint64_t offset() const;

private:
    RawWriter(const FrameDescriptor& description, std::unique_ptr<std::ostream> stream);

    friend std::unique_ptr<RawWriter> createRawWriter(const FrameDescriptor& description,
                                                      std::string_view name);
    friend std::unique_ptr<RawWriter> createRawWriter(const FrameDescriptor& description,
                                                      std::unique_ptr<std::ostream> stream);

    FrameDescriptor m_description;
    std::unique_ptr<std::ostream> m_stream;
};

/*!
 * \brief Create a RawWriter, given a filename.
 * The frame description will be taken from the first written frame
 *
 * @param[in]       name            Filename of raw output file
 * @return                          Unique pointer to the new RawWriter, or nullptr if failed
 */
std::unique_ptr<RawWriter> createRawWriter(std::string_view name);

/*!
 * \brief Create a RawWriter, given a frame description and a filename
 * Written frames must match the description.
 *
 * @param[in]       description     Description of frame (format & size)
 * @param[in]       name            Filename of raw output file
 * @return                          Unique pointer to the new RawWriter, or nullptr if failed
 */
std::unique_ptr<RawWriter> createRawWriter(const FrameDescriptor& description, std::string_view name);

/*!
 * \brief Create a RawWriter, given an ostream
 *
 * @param[in]       description     Description of frame, or a default one to take it from the
 *                                  first written frame
 * @param[in]       stream          Output stream to use - will take ownership
 * @return                          Unique pointer to the new RawWriter, or nullptr if failed
 */
std::unique_ptr<RawWriter> createRawWriter(const FrameDescriptor& description,
                                           std::unique_ptr<std::ostream> stream);

} // namespace vpxdec::utility

#endif // VD_VPXDEC_UTILITY_RAW_WRITER_H
