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

#ifndef VD_VPXDEC_VPX_DECODER_CONFIG_H
#define VD_VPXDEC_VPX_DECODER_CONFIG_H

#include <VPXdec/common/config_map.h>
#include <VPXdec/common/log.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>

namespace vpxdec::decoder {

// Options a VpxDecoder takes at construction, settable by name.
class DecoderConfig
{
public:
    bool validate() const;
    void initialiseLogs() const;

    int32_t getThreads() const { return m_threads; }
    bool getExternalBuffers() const { return m_externalBuffers; }

    // clang-format off
    bool set(const char* name, const bool& val) { return configMap().getConfig(name).set(*this, val); }
    bool set(const char* name, const int32_t& val) { return configMap().getConfig(name).set(*this, val); }
    bool set(const char* name, const std::string& val) { return configMap().getConfig(name).set(*this, val); }
    // clang-format on

    LogLevel getLogLevel(LogComponent comp) const
    {
        return static_cast<LogLevel>(
            std::max(m_logLevelGlobal, m_logLevels[static_cast<size_t>(comp)]));
    }

private:
    static const ConfigMap<DecoderConfig>& configMap();

    bool m_externalBuffers = true;
    bool m_logToStdOut = false;

    int32_t m_logLevelGlobal = static_cast<int32_t>(LogLevel::Info);
    int32_t m_logTimestampPrecision = static_cast<int32_t>(LogPrecision::Nano);
    int32_t m_threads = 0;

    std::array<int32_t, static_cast<size_t>(LogComponent::Count)> m_logLevels = {};
};

} // namespace vpxdec::decoder

#endif // VD_VPXDEC_VPX_DECODER_CONFIG_H
