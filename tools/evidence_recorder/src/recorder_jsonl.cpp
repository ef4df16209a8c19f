#include <atomic>
#include <cstdio>
#include <cmath>
#include <ctime>
#include <string>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string_view>

#include "rtloop/version.hpp"
#include "rtloop/core/time.hpp"
#include "rtloop/timing/rt_stats.hpp"
#include "rtloop/tools/recorder.hpp"

#include "cycle_acc.hpp"
#include "env_buildinfo.hpp"

#if defined(_WIN32)
    #include <io.h>     // _commit
#else
    #include <unistd.h> // fsync
#endif

#ifndef GIT_SHA
#define GIT_SHA "unknown"
#endif

/*
goal: JSONL backend for Recorder
    one JSON object per line: {"ch":"/rtloop/<channel>","body":{...}}
    first line of every segment is a meta record
    rotates by size, rolling fsync every N MiB (or only on segment close)
*/

namespace fs = std::filesystem;
namespace rtloop::tools{
    #if RTLOOP_RECORDER_BACKEND_MCAP
        std::unique_ptr<Recorder> make_mcap_recorder(const RecorderOptions& opt);
    #endif

    // // YYYYMMDD_HHMMSS in UTC for time stamped segment names
    static inline std::string utc_timestamp_filename(){
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t t = system_clock::to_time_t(now);
        std::tm tm{};
        #if defined(_WIN32)
            gmtime_s(&tm, &t);
        #else
            gmtime_r(&t, &tm);
        #endif
        char buf[32];
        std::snprintf(
            buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec
        );
        return std::string(buf);
    }

    static inline std::string jesc(std::string_view s){
        std::string o;
        o.reserve(s.size() + 8);
        for (char c : s){
            switch (c){
                case '"':  o += "\\\""; break;
                case '\\': o += "\\\\"; break;
                case '\n': o += "\\n";  break;
                case '\r': o += "\\r";  break;
                case '\t': o += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20){
                        char u[8];
                        std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        o += u;
                    } else {
                        o.push_back(c);
                    }
            }
        }
        return o;
    }

    static inline void fsync_file(std::FILE* fp){
        ::fflush(fp);
        #if defined(_WIN32)
            _commit(_fileno(fp));
        #else
            ::fsync(fileno(fp));
        #endif
    }

    class RecorderJsonl final : public Recorder{
        public:
            explicit RecorderJsonl(const RecorderOptions& opt) : cfg_{}{
                cfg_.out_dir = opt.out_dir ? opt.out_dir : "evidence";
                cfg_.segment_max_mb = opt.segment_max_mb;
                cfg_.fsync_every_segment = (opt.fsync_policy == RecorderOptions::EverySegment);
                cfg_.fsync_n_mb = opt.fsync_n_mb;
                cfg_.cycle_decimation = opt.cycle_decimation;
                cfg_.loop_id = opt.loop_id ? opt.loop_id : "";
                cfg_.asset_id = opt.asset_id ? opt.asset_id : "";

                dt_ns_hint_ = opt.dt_ns_hint;
                std::error_code ec;
                fs::create_directories(cfg_.out_dir, ec);
            }

            ~RecorderJsonl() override{
                close_current_();
            }

            void write_buildinfo() override{
                ensure_open_();
                auto bi = detail::make_buildinfo(
                    static_cast<std::uint64_t>(dt_ns_hint_ > 0 ? dt_ns_hint_ : 0),
                    cfg_.loop_id.c_str(),
                    cfg_.asset_id.c_str(),
                    static_cast<std::uint32_t>(cfg_.cycle_decimation > 0 ? cfg_.cycle_decimation : 1)
                );

                std::string line;
                line.reserve(512);
                line += R"({"ch":"/rtloop/buildinfo","body":{)";
                line += R"("rtloop_version":")"  + jesc(bi.rtloop_version) + R"(",)";
                line += R"("git_sha":")"         + jesc(bi.git_sha)        + R"(",)";
                line += R"("compiler":")"        + jesc(bi.compiler)       + R"(",)";
                line += R"("flags":")"           + jesc(bi.flags)          + R"(",)";
                line += R"("scalar_type":")"     + jesc(bi.scalar_type)    + R"(",)";
                line += R"("dt_ns":)"            + std::to_string(bi.dt_ns) + ",";
                line += R"("loop_id":")"         + jesc(bi.loop_id)        + R"(",)";
                line += R"("asset_id":")"        + jesc(bi.asset_id)       + R"(",)";
                line += R"("cycle_decimation":)" + std::to_string(bi.cycle_decimation);
                line += R"(}})";
                write_line_(line);
            }

            void write_time_anchor(std::int64_t epoch_mono_ns, std::int64_t epoch_utc_ns) override{
                ensure_open_();
                std::string line;
                line.reserve(192);
                line += R"({"ch":"/rtloop/time_anchor","body":{"clock_domain":"MONO","epoch_mono_ns":)";
                line += std::to_string(static_cast<long long>(epoch_mono_ns));
                line += R"(,"epoch_utc_ns":)";
                line += std::to_string(static_cast<long long>(epoch_utc_ns));
                line += R"(}})";
                write_line_(line);
            }

            void write_cycle(const CycleSample& s) override{
                ensure_open_();

                // violations always pass the decimation gate -> a miss is never dropped from evidence
                if (!s.violation && decim_skip_()) return;

                acc_.on_cycle(s.setpoint, s.measured, s.output, s.violation);
                acc_.on_latency_us(static_cast<double>(s.latency) * 1e-3);

                std::string c;
                c.reserve(256);
                c += R"({"ch":"/rtloop/cycle","body":{"seq":)";
                c += std::to_string(static_cast<unsigned long long>(++seq_));
                c += R"(,"t_ns":)";          c += std::to_string(static_cast<long long>(s.t));
                c += R"(,"cycle_index":)";   c += std::to_string(static_cast<unsigned long long>(s.cycle_index));
                c += R"(,"latency_ns":)";    c += std::to_string(static_cast<long long>(s.latency));
                c += R"(,"period_ns":)";     c += std::to_string(static_cast<long long>(s.period));
                c += R"(,"violation":)";     c += (s.violation ? "true" : "false");
                c += R"(,"setpoint":)";      c += to_fix_(s.setpoint);
                c += R"(,"measured":)";      c += to_fix_(s.measured);
                c += R"(,"output":)";        c += to_fix_(s.output);
                c += R"(,"saturated":)";     c += (s.saturated ? "true" : "false");
                c += R"(}})";
                write_line_(c);

                rotate_if_needed();
            }

            void write_stats(const RtStats& st) override{
                ensure_open_();
                acc_.finalize_latency_percentiles();

                // empty stats keep the sentinel out of the evidence
                const long long min_lat = st.has_data() ? static_cast<long long>(st.min_latency) : 0;

                std::string line;
                line.reserve(384);
                line += R"({"ch":"/rtloop/stats","body":{)";
                line += R"("cycles_count":)"    + std::to_string(static_cast<unsigned long long>(st.cycles_count)) + ",";
                line += R"("deadline_misses":)" + std::to_string(static_cast<unsigned long long>(st.deadline_misses)) + ",";
                line += R"("skipped_cycles":)"  + std::to_string(static_cast<unsigned long long>(st.skipped_cycles)) + ",";
                line += R"("min_latency_ns":)"  + std::to_string(min_lat) + ",";
                line += R"("max_latency_ns":)"  + std::to_string(static_cast<long long>(st.max_latency)) + ",";
                line += R"("avg_latency_ns":)"  + std::to_string(static_cast<long long>(st.avg_latency)) + ",";
                line += R"("p50_lat_us":)"      + to_fix_(acc_.p50_lat_us) + ",";
                line += R"("p95_lat_us":)"      + to_fix_(acc_.p95_lat_us) + ",";
                line += R"("p99_lat_us":)"      + to_fix_(acc_.p99_lat_us) + ",";
                line += R"("iae":)"             + to_fix_(acc_.iae) + ",";
                line += R"("tvu":)"             + to_fix_(acc_.tvu) + ",";
                line += R"("recorded_cycles":)" + std::to_string(static_cast<unsigned long long>(acc_.recorded));
                line += R"(}})";
                write_line_(line);
            }

            void rotate_if_needed() override{
                if (!fp_) return;
                const std::size_t max_bytes = cfg_.segment_max_mb * 1024ull * 1024ull;
                if (written_bytes_ >= max_bytes){
                    rotate_segment_();
                } else if (!cfg_.fsync_every_segment){
                    const std::size_t nbyte = cfg_.fsync_n_mb * 1024ull * 1024ull;
                    if ((written_bytes_ - last_fsync_mark_) >= nbyte){
                        fsync_file(fp_);
                        last_fsync_mark_ = written_bytes_;
                    }
                }
            }

            void flush() override{
                if (!fp_) return;
                fsync_file(fp_);
            }

        private:
            struct RecorderConfig{
                std::string out_dir;
                std::size_t segment_max_mb{256};
                bool fsync_every_segment{false};
                std::size_t fsync_n_mb{16};
                int cycle_decimation{1};
                std::string loop_id;
                std::string asset_id;
            };

            void write_line_(const std::string& line){
                if (!fp_) return;
                const std::string out = line + "\n";
                const std::size_t n = std::fwrite(out.data(), 1, out.size(), fp_);
                written_bytes_ += n;
                if (n != out.size() && !short_write_reported_){
                    std::fprintf(stderr, "rtloop_recorder: short write on '%s'\n", current_path_.c_str());
                    short_write_reported_ = true;
                }
            }

            // GIT_SHA + UTC time + process local sequence -> unique even within one second
            static std::string make_filename_(const std::string& dir){
                static std::atomic<std::uint64_t> seq{0};
                const std::string ts = utc_timestamp_filename();
                const std::uint64_t s = seq.fetch_add(1, std::memory_order_relaxed);
                return (fs::path(dir) / ("rtloop_" + std::string(GIT_SHA) + "_" + ts + "_" + std::to_string(s) + ".jsonl")).string();
            }

            void ensure_open_(){
                if (fp_) return;
                open_new_file_();
            }

            void open_new_file_(){
                current_path_ = make_filename_(cfg_.out_dir);
                fp_ = std::fopen(current_path_.c_str(), "wb");
                written_bytes_ = 0;
                last_fsync_mark_ = 0;
                short_write_reported_ = false;

                if (!fp_){
                    std::fprintf(stderr, "rtloop_recorder: failed to open '%s'\n", current_path_.c_str());
                    return;
                }

                std::string meta;
                meta.reserve(256);
                meta += R"({"meta":{"schema_backend":"jsonl","dt_ns":)";
                meta += std::to_string(dt_ns_hint_);
                meta += R"(,"rtloop_version":")" + std::string(rtloop::kVersionStr) + R"(",)";
                meta += R"("git_sha":")" + std::string(GIT_SHA) + R"(","schema_registry_snapshot":[]}})";
                write_line_(meta);

                seq_ = 0;
            }

            void close_current_(){
                if (!fp_) return;
                fsync_file(fp_);
                std::fclose(fp_);
                fp_ = nullptr;
            }

            void rotate_segment_(){
                close_current_();
                open_new_file_();
            }

            static inline std::string to_fix_(double v){
                if (!std::isfinite(v)) return "null";
                char buf[64];
                std::snprintf(buf, sizeof(buf), "%.9g", v);
                return std::string(buf);
            }

            // keep only every Nth cycle
            bool decim_skip_(){
                if (cfg_.cycle_decimation <= 1) return false;
                return (cycle_index_++ % static_cast<std::uint64_t>(cfg_.cycle_decimation)) != 0;
            }

        private:
            RecorderConfig cfg_;
            std::FILE* fp_{nullptr};
            std::string current_path_{};

            std::size_t written_bytes_{0};
            std::size_t last_fsync_mark_{0};
            bool short_write_reported_{false};

            long long dt_ns_hint_{0};

            std::uint64_t seq_{0};
            std::uint64_t cycle_index_{0};

            detail::CycleAcc acc_{};
    };

    std::unique_ptr<Recorder> Recorder::open(const RecorderOptions& opt){
        #if RTLOOP_RECORDER_BACKEND_MCAP
            return make_mcap_recorder(opt);
        #else
            return std::unique_ptr<Recorder>(new RecorderJsonl(opt));
        #endif
    }

} // namespace rtloop::tools
