#pragma once

#include "rtloop/core/time.hpp"

namespace rtloop{
    enum class LogLevel {
        kTrace,
        kDebug,
        kInfo,
        kWarn,
        kError
    };

    // // static name, never null
    const char* to_string(LogLevel lvl) noexcept;

    struct LoggerSink{
        virtual ~LoggerSink() = default;
        virtual void log(LogLevel lvl, const char *msg, t_ns t) noexcept = 0;
    };

} // namespace rtloop
