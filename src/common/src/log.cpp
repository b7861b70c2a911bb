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

#include <VPXdec/common/enum_map.h>
#include <VPXdec/common/log.h>

#include <algorithm>
#include <chrono>
#include <cstddef>

// ------------------------------------------------------------------------------------------------

namespace vpxdec {

// - Static variables -----------------------------------------------------------------------------

static const LogComponent kComp = LogComponent::Log;

static constexpr size_t kFormatBufferSize = 16384;
static thread_local char sFormatBuffer[2][kFormatBufferSize];

static constexpr EnumMapArr<LogComponent, static_cast<size_t>(LogComponent::Count)> kLogComponentMap{{{
    {LogComponent::Bridge, "Bridge"},
    {LogComponent::BufferPool, "BufferPool"},
    {LogComponent::Config, "Config"},
    {LogComponent::Decoder, "Decoder"},
    {LogComponent::FramePool, "FramePool"},
    {LogComponent::Image, "Image"},
    {LogComponent::Log, "Log"},
    {LogComponent::Registry, "Registry"},
}}};
static_assert(!kLogComponentMap.isMissingEnums(),
              "kLogComponentMap is missing an entry for some enum.");

static bool isSevere(LogLevel level)
{
    return level == LogLevel::Error || level == LogLevel::Fatal;
}

std::string_view logComponentName(LogComponent comp)
{
    return enumToString(kLogComponentMap, comp);
}

// - Logger ---------------------------------------------------------------------------------------

Logger sLog;

Logger::Logger()
{
    // Errors are reported until a caller configures otherwise.
    for (auto& verbosity : m_verbosities) {
        verbosity = LogLevel::Error;
    }
}

Logger::~Logger()
{
    if (m_enableStdout) {
        fflush(stdout);
    } else {
        fflush(stderr);
    }
}

void Logger::setVerbosity(LogComponent comp, LogLevel level) { m_verbosities[comp] = level; }

void Logger::setCallback(LogCallback callback, void* userptr)
{
    m_callback = callback;
    m_callbackUser = userptr;
}

bool Logger::getEnableStdout() const { return m_enableStdout; }

void Logger::setEnableStdout(bool enable)
{
    m_enableStdout = enable;
    VDLogTrace("enableStdout set to: %s\n", enable ? "true" : "false");
}

void Logger::setTimestampPrecision(LogPrecision precision) { m_timingPrecision = precision; }

void Logger::print(LogComponent comp, LogLevel level, const char* function, uint32_t line,
                   const char* format, ...)
{
    va_list args;
    va_start(args, format);
    Logger::printv(comp, level, function, line, format, args);
    va_end(args);
}

void Logger::printv(LogComponent comp, LogLevel level, const char* function, uint32_t line,
                    const char* format, va_list ap)
{
    if (level == LogLevel::Disabled || level > m_verbosities[comp]) {
        return;
    }

    vsnprintf(sFormatBuffer[0], kFormatBufferSize, format, ap);

    std::string_view compName = logComponentName(comp);
    if (compName.empty()) {
        compName = "unknown";
    }

    int32_t count = 0;
    if (m_timingPrecision != LogPrecision::NoTimestamps) {
        count = snprintf(sFormatBuffer[1], kFormatBufferSize, "[%" PRId64 "]%s, %s (%u) - %s",
                         getTicks(m_timingPrecision), compName.data(), function, line,
                         sFormatBuffer[0]);
    } else {
        count = snprintf(sFormatBuffer[1], kFormatBufferSize, "%s, %s (%u) - %s",
                         compName.data(), function, line, sFormatBuffer[0]);
    }
    if (count < 0) {
        return;
    }
    const size_t length = std::min(static_cast<size_t>(count), kFormatBufferSize - 1);
    const char* output = sFormatBuffer[1];

    // A callback takes over all output.
    if (m_callback) {
        m_callback(m_callbackUser, level, output);
        return;
    }

    if (m_enableStdout) {
        fwrite(output, sizeof(char), length, stdout);
        return;
    }

    // Logs from a given run should not be split between stdout and stderr, so stderr only sees
    // the severe ones.
    if (isSevere(level)) {
        fwrite(output, sizeof(char), length, stderr);
    }
}

int64_t Logger::getTicks(LogPrecision precision)
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    switch (precision) {
        case LogPrecision::Micro:
            return std::chrono::duration_cast<std::chrono::microseconds>(now).count();
        case LogPrecision::Nano:
            return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
        case LogPrecision::NoTimestamps:
        case LogPrecision::Count: break;
    }
    return -1;
}

} // namespace vpxdec
