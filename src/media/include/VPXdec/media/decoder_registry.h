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

#ifndef VD_VPXDEC_MEDIA_DECODER_REGISTRY_H
#define VD_VPXDEC_MEDIA_DECODER_REGISTRY_H

#include <VPXdec/common/class_utils.hpp>
#include <VPXdec/media/types.h>
#include <VPXdec/media/video_decoder.h>

#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace vpxdec {

using BuilderPtr = std::shared_ptr<const VideoDecoderBuilder>;

// Builders by codec id. Populated during startup, read-only afterwards. Several builders may serve
// one codec: lookups by id return the first, and preferred builders are put first.
class DecoderRegistry
{
public:
    DecoderRegistry() = default;
    VDNoCopyNoMove(DecoderRegistry);
    ~DecoderRegistry() = default;

    // The process-wide registry.
    static DecoderRegistry& instance();

    // Returns false (and registers nothing) for a null builder or a name already registered.
    bool registerDecoder(BuilderPtr builder, bool preferred);

    BuilderPtr findDecoder(CodecId id) const;
    BuilderPtr findDecoder(std::string_view name) const;

    ReturnCode createDecoder(CodecId id, const VideoDecoderParameters& params,
                             const DecoderOptions* options,
                             std::unique_ptr<VideoDecoder>& decoderOut) const;

    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<CodecId, std::vector<BuilderPtr>> m_builders;
};

} // namespace vpxdec

#endif // VD_VPXDEC_MEDIA_DECODER_REGISTRY_H
