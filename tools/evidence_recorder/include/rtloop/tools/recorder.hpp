#pragma once

#include <memory>
#include <cstdint>
#include <cstddef>

#include "rtloop/core/time.hpp"
#include "rtloop/timing/rt_stats.hpp"
#include "rtloop/timing/cycle_pacer.hpp"

#ifndef RTLOOP_FB_SCHEMA_DIR
#define RTLOOP_FB_SCHEMA_DIR "tools/evidence_recorder/schemas"
#endif

namespace rtloop::tools{
    struct CycleSample{
        /*
        t = wake time, monotonic ns
        latency/period = what the pacer measured the cycle against
        setpoint/measured/output = control law inputs and its clamped output this cycle
        */
        t_ns t{};
        std::uint64_t cycle_index{};
        t_ns latency{};
        dt_ns period{};
        bool violation{false};
        double setpoint{};
        double measured{};
        double output{};
        bool saturated{false};
    };

    // // pacer outcome -> timing part of a sample; control fields are left to the caller
    inline CycleSample timing_sample(const Expected<CycleTiming>& r, t_ns t_now) noexcept{
        CycleSample s{};
        if (r.has_value()){
            const CycleTiming& c = r.value();
            s.t = c.wake;
            s.cycle_index = c.cycle_index;
            s.latency = c.latency;
            s.period = c.period;
        } else {
            s.t = t_now;
            s.latency = r.error().actual;
            s.period = r.error().expected;
            s.violation = r.error().is_real_time_violation();
            s.cycle_index = r.error().cycle_index;
        }
        return s;
    }

    struct RecorderOptions{
        const char* out_dir{"evidence"};                // output directory for segments
        const char* schema_dir{RTLOOP_FB_SCHEMA_DIR};   // FlatBuffer schema (.bfbs) location
        std::size_t segment_max_mb{256};                // rotation size threshold
        std::size_t fsync_n_mb{16};                     // between rolling fsync calls
        int cycle_decimation{1};                        // record every Nth cycle
        enum FsyncPolicy{EverySegment, EveryNMB} fsync_policy{EveryNMB};
        long long dt_ns_hint{0};                        // loop period hint
        const char* loop_id{""};                        // eg: axis0_position
        const char* asset_id{""};
    };

    class Recorder{
        public:
            // // JSONL by default, MCAP when built with RTLOOP_RECORDER_BACKEND_MCAP
            [[nodiscard]] static std::unique_ptr<Recorder> open(const RecorderOptions& opt);

            virtual ~Recorder() = default;

            // compiler/git/version metadata
            virtual void write_buildinfo() = 0;

            // maps monotonic clock to UTC for audit correlation
            virtual void write_time_anchor(std::int64_t epoch_mono_ns,
                                           std::int64_t epoch_utc_ns) = 0;

            // per cycle evidence
            virtual void write_cycle(const CycleSample& s) = 0;

            // pacer stats snapshot + recorder side latency percentiles
            virtual void write_stats(const RtStats& st) = 0;

            // roll output files based on size limits
            virtual void rotate_if_needed() = 0;

            // force fsync
            virtual void flush() = 0;
    };
} // namespace rtloop::tools
