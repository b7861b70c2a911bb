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

#include <VPXdec/common/log.h>
#include <VPXdec/media/decoder_registry.h>

#include <string>

namespace vpxdec {

static const LogComponent kComp = LogComponent::Registry;

DecoderRegistry& DecoderRegistry::instance()
{
    static DecoderRegistry sRegistry;
    return sRegistry;
}

bool DecoderRegistry::registerDecoder(BuilderPtr builder, bool preferred)
{
    if (!builder) {
        VDLogError("Null decoder builder\n");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, builders] : m_builders) {
        for (const BuilderPtr& existing : builders) {
            if (existing->name() == builder->name()) {
                VDLogDebug("Decoder %.*s already registered\n",
                           static_cast<int>(builder->name().size()), builder->name().data());
                return false;
            }
        }
    }

    std::vector<BuilderPtr>& builders = m_builders[builder->id()];
    VDLogInfo("Registering decoder %.*s%s\n", static_cast<int>(builder->name().size()),
              builder->name().data(), preferred ? " (preferred)" : "");
    if (preferred) {
        builders.insert(builders.begin(), std::move(builder));
    } else {
        builders.push_back(std::move(builder));
    }
    return true;
}

BuilderPtr DecoderRegistry::findDecoder(CodecId id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto iter = m_builders.find(id);
    if (iter == m_builders.end() || iter->second.empty()) {
        return nullptr;
    }
    return iter->second.front();
}

BuilderPtr DecoderRegistry::findDecoder(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, builders] : m_builders) {
        for (const BuilderPtr& builder : builders) {
            if (builder->name() == name) {
                return builder;
            }
        }
    }
    return nullptr;
}

ReturnCode DecoderRegistry::createDecoder(CodecId id, const VideoDecoderParameters& params,
                                          const DecoderOptions* options,
                                          std::unique_ptr<VideoDecoder>& decoderOut) const
{
    BuilderPtr builder = findDecoder(id);
    if (!builder) {
        VDLogError("No decoder registered for codec %d\n", static_cast<int>(id));
        return ReturnCode::NotFound;
    }
    return builder->createDecoder(id, params, options, decoderOut);
}

size_t DecoderRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& [id, builders] : m_builders) {
        count += builders.size();
    }
    return count;
}

} // namespace vpxdec
