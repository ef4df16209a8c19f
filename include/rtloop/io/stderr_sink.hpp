#pragma once

#include <atomic>
#include <cstdio>

#include "rtloop/io/logger.hpp"

namespace rtloop{
    /*
    LoggerSink writing "[t_ns] LEVEL tag: msg" lines to a FILE* (stderr by default)
        lines below min_level are dropped
        one fprintf per line -> lines from different threads do not interleave mid line
        one sink may be shared by several threads; the line counter is atomic
    */
    class StderrSink final : public LoggerSink{
        public:
            explicit StderrSink(LogLevel min_level = LogLevel::kInfo, const char* tag = "rtloop", std::FILE* out = nullptr) noexcept
                : min_(min_level), tag_(tag ? tag : ""), out_(out) {}

            void log(LogLevel lvl, const char* msg, t_ns t) noexcept override;

            LogLevel min_level() const noexcept{
                return min_;
            }

            // // lines actually written (after filtering)
            unsigned long long lines() const noexcept{
                return lines_.load(std::memory_order_relaxed);
            }

        private:
            LogLevel min_{LogLevel::kInfo};
            const char* tag_{""};
            std::FILE* out_{nullptr};    // nullptr -> stderr
            std::atomic<unsigned long long> lines_{0};
    };

} // namespace rtloop
