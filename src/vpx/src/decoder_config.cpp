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

#include "decoder_config.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace vpxdec::decoder {

static const LogComponent kComp = LogComponent::Config;

namespace {

    // "FramePool" -> "frame_pool"
    std::string snakeCase(std::string_view name)
    {
        std::string out;
        for (const char c : name) {
            if (std::isupper(static_cast<unsigned char>(c))) {
                if (!out.empty()) {
                    out += '_';
                }
                out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            } else {
                out += c;
            }
        }
        return out;
    }

} // namespace

// - DecoderConfig --------------------------------------------------------------------------------

const ConfigMap<DecoderConfig>& DecoderConfig::configMap()
{
    static const ConfigMap<DecoderConfig> kConfigMap = [] {
        ConfigMap<DecoderConfig> map;
        map.add("external_buffers", makeBinding(&DecoderConfig::m_externalBuffers));
        map.add("log_level", makeBinding(&DecoderConfig::m_logLevelGlobal));
        map.add("log_stdout", makeBinding(&DecoderConfig::m_logToStdOut));
        map.add("log_timestamp_precision", makeBinding(&DecoderConfig::m_logTimestampPrecision));
        map.add("threads", makeBinding(&DecoderConfig::m_threads));

        // log_level_bridge, log_level_buffer_pool, ...
        for (size_t comp = 0; comp < static_cast<size_t>(LogComponent::Count); ++comp) {
            map.add("log_level_" + snakeCase(logComponentName(static_cast<LogComponent>(comp))),
                    makeBindingArrElement(&DecoderConfig::m_logLevels, comp));
        }
        return map;
    }();
    return kConfigMap;
}

bool DecoderConfig::validate() const
{
    bool valid = true;

    // m_logLevelGlobal
    if (m_logLevelGlobal < static_cast<int32_t>(LogLevel::Disabled) ||
        m_logLevelGlobal >= static_cast<int32_t>(LogLevel::Count)) {
        VDLogError("Invalid config: log level must be between %d and %d (inclusive), but %d was "
                   "supplied as the global log level.\n",
                   static_cast<int32_t>(LogLevel::Disabled),
                   static_cast<int32_t>(LogLevel::Count) - 1, m_logLevelGlobal);
        valid = false;
    }

    // m_logLevels
    for (size_t idx = 0; idx < m_logLevels.size(); idx++) {
        const int32_t logLevel = m_logLevels[idx];
        if (logLevel < static_cast<int32_t>(LogLevel::Disabled) ||
            logLevel >= static_cast<int32_t>(LogLevel::Count)) {
            VDLogError("Invalid config: log levels must be between %d and %d (inclusive), but %d "
                       "was supplied for component %zu.\n",
                       static_cast<int32_t>(LogLevel::Disabled),
                       static_cast<int32_t>(LogLevel::Count) - 1, logLevel, idx);
            valid = false;
        }
    }

    // m_logTimestampPrecision
    if (m_logTimestampPrecision < static_cast<int32_t>(LogPrecision::Nano) ||
        m_logTimestampPrecision >= static_cast<int32_t>(LogPrecision::Count)) {
        VDLogError("Invalid config: log_timestamp_precision should be between %d and %d, "
                   "inclusive, but it's %d\n",
                   static_cast<int32_t>(LogPrecision::Nano),
                   static_cast<int32_t>(LogPrecision::Count) - 1, m_logTimestampPrecision);
        valid = false;
    }

    // m_threads
    if (m_threads < 0) {
        VDLogError("Invalid config: threads should not be negative, but it's %d\n", m_threads);
        valid = false;
    }

    VDLogDebug("Config:\n"
               "\texternal_buffers         : %d\n"
               "\tlog_level                : %d\n"
               "\tlog_stdout               : %d\n"
               "\tthreads                  : %d\n"
               "\tper-component log levels : %s\n",
               m_externalBuffers, m_logLevelGlobal, m_logToStdOut, m_threads,
               iterableToString(m_logLevels).c_str());
    return valid;
}

void DecoderConfig::initialiseLogs() const
{
    for (size_t comp = 0; comp < static_cast<size_t>(LogComponent::Count); ++comp) {
        sLog.setVerbosity(static_cast<LogComponent>(comp), getLogLevel(static_cast<LogComponent>(comp)));
    }
    sLog.setEnableStdout(m_logToStdOut);
    sLog.setTimestampPrecision(static_cast<LogPrecision>(m_logTimestampPrecision));
}

} // namespace vpxdec::decoder
