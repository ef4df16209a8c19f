#pragma once

#include <cstdint>

namespace rtloop{
    enum class Status : std::uint8_t{
        kOK = 0,
        kInvalidArg,
        kPreconditionFail,
        kNotReady,
        kDeadlineMiss,          // RealTimeViolation
        kNoMem,
        kHardwareInitFailed,
        kSensorDataUnavailable,
        kControlLoopError,
    };

    // // static name for log lines, never null
    const char* to_string(Status s) noexcept;

} // namespace rtloop
