#include <cstdio>

#include "rtloop/core/error.hpp"
#include "rtloop/core/status.hpp"

namespace rtloop{
    const char* to_string(Status s) noexcept{
        switch (s){
            case Status::kOK:                    return "OK";
            case Status::kInvalidArg:            return "InvalidArg";
            case Status::kPreconditionFail:      return "PreconditionFail";
            case Status::kNotReady:              return "NotReady";
            case Status::kDeadlineMiss:          return "RealTimeViolation";
            case Status::kNoMem:                 return "NoMem";
            case Status::kHardwareInitFailed:    return "HardwareInitFailed";
            case Status::kSensorDataUnavailable: return "SensorDataUnavailable";
            case Status::kControlLoopError:      return "ControlLoopError";
        }
        return "Unknown";
    }

    std::size_t format_error(const Error& e, std::span<char> out) noexcept{
        if (out.empty()) return 0;

        int n = 0;
        switch (e.code){
            case Status::kDeadlineMiss:
                n = std::snprintf(out.data(), out.size(), "%s: expected=%lldns actual=%lldns",
                                  to_string(e.code),
                                  static_cast<long long>(e.expected),
                                  static_cast<long long>(e.actual));
                break;

            case Status::kHardwareInitFailed:
            case Status::kControlLoopError:
                n = std::snprintf(out.data(), out.size(), "%s: %s", to_string(e.code), e.reason);
                break;

            default:
                n = std::snprintf(out.data(), out.size(), "%s", to_string(e.code));
                break;
        }

        if (n < 0){
            out[0] = '\0';
            return 0;
        }
        // truncated -> report what actually landed in the buffer
        const std::size_t w = static_cast<std::size_t>(n);
        return (w < out.size()) ? w : out.size() - 1;
    }

} // namespace rtloop
