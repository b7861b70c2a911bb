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

#ifndef VD_VPXDEC_COMMON_LOG_H
#define VD_VPXDEC_COMMON_LOG_H

#include <array>
#include <cinttypes>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

// - Enums ----------------------------------------------------------------------------------------

namespace vpxdec {

// Higher numbers mean more logs.
enum class LogLevel
{
    Disabled,
    Fatal,
    Error,
    Warning,
    Info,
    Debug,
    Trace,

    Count
};
static_assert(LogLevel::Disabled == LogLevel{},
              "Please keep Disabled as the default-constructed LogLevel (LogArr entries "
              "value-initialise to it)");

// Note: the numeric values of this enum do not matter. Generally, the component should simply be
// the name of the file or class which is reporting the log.
enum class LogComponent
{
    Bridge,
    BufferPool,
    Config,
    Decoder,
    FramePool,
    Image,
    Log,
    Registry,

    Count
};

enum class LogPrecision
{
    Nano,
    Micro,
    NoTimestamps,

    Count
};

// - Types and classes ----------------------------------------------------------------------------

using LogCallback = void (*)(void* userptr, LogLevel level, const char* msg);

// Slightly cheeky class to save us from static_casting to size_t all the time
class LogArr : public std::array<LogLevel, static_cast<size_t>(LogComponent::Count)>
{
    using BaseClass = std::array<LogLevel, static_cast<size_t>(LogComponent::Count)>;

public:
    LogArr() = default;
    LogLevel& operator[](LogComponent comp)
    {
        return BaseClass::operator[](static_cast<size_t>(comp));
    }
    const LogLevel& operator[](LogComponent comp) const
    {
        return BaseClass::operator[](static_cast<size_t>(comp));
    }
};

class Logger
{
public:
    Logger();
    ~Logger();
    Logger(const Logger& other) = delete;
    Logger(Logger&& other) = delete;
    Logger& operator=(const Logger& other) = delete;
    Logger& operator=(Logger&& other) = delete;

    void setVerbosity(LogComponent comp, LogLevel level);
    LogLevel getVerbosity(LogComponent comp) const { return m_verbosities[comp]; }
    void setCallback(LogCallback callback, void* userptr);
    bool getEnableStdout() const;
    void setEnableStdout(bool enable);
    void setTimestampPrecision(LogPrecision precision);

    void print(LogComponent comp, LogLevel level, const char* function, uint32_t line,
               const char* format, ...);
    void printv(LogComponent comp, LogLevel level, const char* function, uint32_t line,
                const char* format, va_list ap);

private:
    static int64_t getTicks(LogPrecision precision);

    LogCallback m_callback = nullptr;
    void* m_callbackUser = nullptr;
    bool m_enableStdout = false;
    LogPrecision m_timingPrecision = LogPrecision::Nano;
    LogArr m_verbosities = {};
};

extern Logger sLog;

std::string_view logComponentName(LogComponent comp);

} // namespace vpxdec

// ------------------------------------------------------------------------------------------------

// Use this to log from within a lambda (since __func__ doesn't work right in lambdas)
#define VDLogCustomFnName(level, msg, fnName, ...)                        \
    do {                                                                  \
        ::vpxdec::sLog.print(kComp, level, fnName, 0, msg, ##__VA_ARGS__); \
    } while (0)

// You're expected to set kComp for the file in which you're triggering logs.
#define VDLog(level, msg, ...)                                                      \
    do {                                                                            \
        ::vpxdec::sLog.print(kComp, level, __func__, __LINE__, msg, ##__VA_ARGS__); \
    } while (0)

#define VDLogFatal(msg, ...) VDLog(::vpxdec::LogLevel::Fatal, msg, ##__VA_ARGS__)

#define VDLogError(msg, ...) VDLog(::vpxdec::LogLevel::Error, msg, ##__VA_ARGS__)

#define VDLogWarning(msg, ...) VDLog(::vpxdec::LogLevel::Warning, msg, ##__VA_ARGS__)

#define VDLogInfo(msg, ...) VDLog(::vpxdec::LogLevel::Info, msg, ##__VA_ARGS__)

#define VDLogDebug(msg, ...) VDLog(::vpxdec::LogLevel::Debug, msg, ##__VA_ARGS__)

#define VDLogTrace(msg, ...) VDLog(::vpxdec::LogLevel::Trace, msg, ##__VA_ARGS__)

// ------------------------------------------------------------------------------------------------

// Helper to print iterable objects. Use sparingly (printing should be cheap).
template <typename T>
static inline std::string iterableToString(const T& iterable)
{
    std::string out = "{";
    for (const auto& item : iterable) {
        out += std::to_string(item);
        out += ", ";
    }
    if (out.size() > 1) {
        out.resize(out.size() - 2);
    }
    out += "}";
    return out;
}

#endif // VD_VPXDEC_COMMON_LOG_H
