#include <cstdio>

#include "rtloop/io/logger.hpp"
#include "rtloop/io/stderr_sink.hpp"

namespace rtloop{
    const char* to_string(LogLevel lvl) noexcept{
        switch (lvl){
            case LogLevel::kTrace: return "TRACE";
            case LogLevel::kDebug: return "DEBUG";
            case LogLevel::kInfo:  return "INFO";
            case LogLevel::kWarn:  return "WARN";
            case LogLevel::kError: return "ERROR";
        }
        return "?";
    }

    void StderrSink::log(LogLevel lvl, const char* msg, t_ns t) noexcept{
        if (static_cast<int>(lvl) < static_cast<int>(min_)) return;
        std::FILE* f = out_ ? out_ : stderr;
        std::fprintf(f, "[%lld] %s %s: %s\n", static_cast<long long>(t), to_string(lvl), tag_, msg ? msg : "");
        lines_.fetch_add(1, std::memory_order_relaxed);
    }

} // namespace rtloop
