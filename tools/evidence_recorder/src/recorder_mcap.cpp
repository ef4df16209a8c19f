#include <atomic>
#include <vector>
#include <chrono>
#include <cstdio>
#include <string>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string_view>

#include "cycle_acc.hpp"
#include "env_buildinfo.hpp"

#include "rtloop/timing/rt_stats.hpp"
#include "rtloop/tools/recorder.hpp"

// // value check gate -> compile mcap + flatbuffers
#if RTLOOP_RECORDER_BACKEND_MCAP
    #if defined(__GNUC__)
        #  pragma GCC diagnostic push
        #  pragma GCC diagnostic ignored "-Wshadow"
    #endif

    #include <mcap/writer.hpp>

    #if defined(__GNUC__)
        #  pragma GCC diagnostic pop
    #endif

    #include <flatbuffers/flatbuffers.h>

    #include "hash.hpp"

    // generated by flatc from schemas/rtloop_metrics.fbs
    #include "rtloop_metrics_generated.h"
#endif

#ifndef GIT_SHA
#define GIT_SHA "unknown"
#endif

namespace fs = std::filesystem;

namespace rtloop::tools{
    #if RTLOOP_RECORDER_BACKEND_MCAP
        static constexpr const char* kBfbsName = "rtloop_metrics.bfbs";

        static inline std::string utc_ns_string(){
            using namespace std::chrono;
            auto ns = duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
            return std::to_string(static_cast<long long>(ns));
        }

        /*
        which kernel clock backs CLOCK_MONOTONIC (tsc / hpet / acpi_pm)
        recorded as evidence: latency numbers are only as good as this source
        */
        static inline std::string kernel_clocksource(){
            #if defined(__linux__)
                const char* p = "/sys/devices/system/clocksource/clocksource0/current_clocksource";
                if (std::FILE* f = std::fopen(p, "rb")){
                    char buf[128];
                    const std::size_t n = std::fread(buf, 1, sizeof(buf) - 1, f);
                    const bool err = std::ferror(f) != 0;
                    std::fclose(f);
                    if (err) return "unknown";
                    buf[n] = 0;
                    for (std::size_t i=0; i<n; ++i){
                        if (buf[i] == '\n' || buf[i] == '\r'){
                            buf[i] = 0;
                            break;
                        }
                    }
                    return *buf ? std::string(buf) : std::string("unknown");
                }
                return "unknown";
            #elif defined(_WIN32)
                return "QPC";
            #elif defined(__APPLE__)
                return "mach_absolute_time";
            #else
                return "unknown";
            #endif
        }

        static inline std::vector<std::uint8_t> read_file_bin(const std::string& p){
            std::FILE* f = std::fopen(p.c_str(), "rb");
            if (!f) return {};
            std::vector<std::uint8_t> b;
            b.reserve(4096);
            std::uint8_t buf[4096];
            std::size_t n;
            while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) b.insert(b.end(), buf, buf + n);
            std::fclose(f);
            return b;
        }

        class RecorderMcap final : public Recorder{
            public:
                explicit RecorderMcap(const RecorderOptions& opt) : cfg_{}, builder_(1024){
                    cfg_.out_dir = opt.out_dir ? opt.out_dir : "evidence";
                    cfg_.schema_dir = opt.schema_dir ? opt.schema_dir : RTLOOP_FB_SCHEMA_DIR;
                    cfg_.segment_max_mb = opt.segment_max_mb;
                    cfg_.fsync_n_mb = opt.fsync_n_mb;
                    cfg_.cycle_decimation = opt.cycle_decimation;
                    cfg_.dt_ns_hint = opt.dt_ns_hint;
                    cfg_.fsync_every_segment = (opt.fsync_policy == RecorderOptions::EverySegment);
                    cfg_.loop_id = opt.loop_id ? opt.loop_id : "";
                    cfg_.asset_id = opt.asset_id ? opt.asset_id : "";

                    std::error_code ec;
                    fs::create_directories(cfg_.out_dir, ec);

                    open_new_file_();
                }

                ~RecorderMcap() override{
                    close_current_();
                }

                // // one BuildInfo message on /rtloop/buildinfo
                void write_buildinfo() override{
                    if (!open_) return;
                    auto bi = make_bi_();

                    builder_.Clear();
                    auto fb = rtloop::metrics::CreateBuildInfo(
                        builder_,
                        builder_.CreateString(bi.rtloop_version),
                        builder_.CreateString(bi.git_sha),
                        builder_.CreateString(bi.compiler),
                        builder_.CreateString(bi.flags),
                        builder_.CreateString(bi.scalar_type),
                        static_cast<std::uint64_t>(bi.dt_ns),
                        builder_.CreateString(bi.loop_id),
                        builder_.CreateString(bi.asset_id),
                        static_cast<std::uint32_t>(bi.cycle_decimation)
                    );
                    builder_.Finish(fb);

                    // monotonic anchor if set, else zero
                    publish_(ch_build_, static_cast<std::uint64_t>(mono_anchor_ns_ > 0 ? mono_anchor_ns_ : 0));
                }

                // // MCAP metadata record: monotonic <-> UTC anchor + provenance
                void write_time_anchor(std::int64_t epoch_mono_ns, std::int64_t epoch_utc_ns) override{
                    mono_anchor_ns_ = epoch_mono_ns;
                    if (!open_) return;

                    mcap::KeyValueMap meta;
                    meta["schema_backend"] = "flatbuffers";
                    meta["clock_domain"]   = "MONO";
                    meta["monotonic_to_utc_ns"] =
                        std::string("{\"epoch_mono_ns\":") + std::to_string(epoch_mono_ns) +
                        ",\"epoch_utc_ns\":" + std::to_string(epoch_utc_ns) + "}";
                    meta["kernel_clocksource"] = kernel_clocksource();

                    auto bi = make_bi_();
                    meta["dt_ns"]          = std::to_string(bi.dt_ns);
                    meta["rtloop_version"] = bi.rtloop_version;
                    meta["git_sha"]        = bi.git_sha;

                    const auto bfbs_path = (fs::path(cfg_.schema_dir) / kBfbsName).string();
                    std::error_code fec;
                    if (fs::exists(bfbs_path, fec)){
                        const auto d = hash::blake3_256_file(bfbs_path.c_str());
                        meta["schema_registry_snapshot"] =
                            std::string("[{\"name\":\"") + kBfbsName + "\",\"version\":\"1\",\"blake3\":\"" + hash::to_hex({d.data(), d.size()}) + "\"}]";
                    }

                    mcap::Metadata md;
                    md.name = "rtloop";
                    md.metadata = std::move(meta);
                    const auto st = writer_.write(md);
                    if (!st.ok()) std::fprintf(stderr, "rtloop_mcap: metadata write failed: %s\n", st.message.c_str());
                }

                void write_cycle(const CycleSample& s) override{
                    if (!open_) return;

                    // violations always pass the decimation gate
                    if (!s.violation && cfg_.cycle_decimation > 1 &&
                        (cycle_index_++ % static_cast<std::uint64_t>(cfg_.cycle_decimation)) != 0) return;

                    // MCAP log times must not go backwards
                    if (prev_t_ >= 0 && s.t <= prev_t_) prev_t_ += 1;
                    else prev_t_ = s.t;
                    const std::uint64_t t = static_cast<std::uint64_t>(prev_t_);

                    builder_.Clear();
                    auto cy = rtloop::metrics::CreateCycle(
                        builder_,
                        ++cycle_seq_,
                        t,
                        static_cast<std::uint64_t>(s.cycle_index),
                        static_cast<std::int64_t>(s.latency),
                        static_cast<std::int64_t>(s.period),
                        s.violation,
                        s.setpoint,
                        s.measured,
                        s.output,
                        s.saturated
                    );
                    builder_.Finish(cy);
                    publish_(ch_cycle_, t);

                    acc_.on_cycle(s.setpoint, s.measured, s.output, s.violation);
                    acc_.on_latency_us(static_cast<double>(s.latency) * 1e-3);

                    rotate_if_needed();
                }

                void write_stats(const RtStats& st) override{
                    if (!open_) return;
                    const std::uint64_t t = prev_t_ >= 0 ? static_cast<std::uint64_t>(prev_t_) : static_cast<std::uint64_t>(mono_anchor_ns_ > 0 ? mono_anchor_ns_ : 0);

                    acc_.finalize_latency_percentiles();

                    builder_.Clear();
                    auto sp = rtloop::metrics::CreateStats(
                        builder_,
                        static_cast<std::uint64_t>(st.cycles_count),
                        static_cast<std::uint64_t>(st.deadline_misses),
                        static_cast<std::uint64_t>(st.skipped_cycles),
                        static_cast<std::int64_t>(st.has_data() ? st.min_latency : 0),
                        static_cast<std::int64_t>(st.max_latency),
                        static_cast<std::int64_t>(st.avg_latency),
                        acc_.p50_lat_us, acc_.p95_lat_us, acc_.p99_lat_us,
                        acc_.iae, acc_.tvu,
                        acc_.recorded
                    );
                    builder_.Finish(sp);
                    publish_(ch_stats_, t);
                }

                void rotate_if_needed() override{
                    if (!open_) return;
                    const std::size_t max_bytes = cfg_.segment_max_mb * 1024ull * 1024ull;

                    std::error_code ec;
                    const auto sz = fs::file_size(mcap_path_, ec);
                    if (ec) return;

                    if (sz >= max_bytes){
                        rotate_segment_();
                        return;
                    }

                    if (!cfg_.fsync_every_segment){
                        const std::size_t nbytes = cfg_.fsync_n_mb * 1024ull * 1024ull;
                        if ((sz - last_fsync_mark_) >= nbytes){
                            flush();
                            last_fsync_mark_ = sz;
                        }
                    }
                }

                void flush() override{
                    // McapWriter buffers internally and syncs on close, no handle to fsync here
                }

            private:
                struct RecorderConfig{
                    std::string out_dir;
                    std::string schema_dir;
                    std::size_t segment_max_mb{256};
                    std::size_t fsync_n_mb{16};
                    bool fsync_every_segment{false};
                    int cycle_decimation{1};
                    long long dt_ns_hint{0};
                    std::string loop_id;
                    std::string asset_id;
                };

                detail::BuildInfoPack make_bi_() const{
                    return detail::make_buildinfo(
                        static_cast<std::uint64_t>(cfg_.dt_ns_hint > 0 ? cfg_.dt_ns_hint : 0),
                        cfg_.loop_id.c_str(), cfg_.asset_id.c_str(),
                        static_cast<std::uint32_t>(cfg_.cycle_decimation > 0 ? cfg_.cycle_decimation : 1)
                    );
                }

                // // finished builder bytes -> one MCAP message on channel ch
                void publish_(mcap::ChannelId ch, std::uint64_t t){
                    mcap::Message msg;
                    msg.channelId = ch;
                    msg.sequence = static_cast<std::uint32_t>(seq_++);
                    msg.logTime = t;
                    msg.publishTime = t;
                    msg.data = reinterpret_cast<const std::byte*>(builder_.GetBufferPointer());
                    msg.dataSize = builder_.GetSize();
                    const auto st = writer_.write(msg);
                    if (!st.ok() && !write_err_reported_){
                        std::fprintf(stderr, "rtloop_mcap: write failed on '%s': %s\n", mcap_path_.string().c_str(), st.message.c_str());
                        write_err_reported_ = true;
                    }
                }

                static std::string make_filename_(const std::string& dir, const char* ext){
                    static std::atomic<std::uint64_t> seq{0};
                    const std::string utcns = utc_ns_string();
                    const std::uint64_t s = seq.fetch_add(1, std::memory_order_relaxed);
                    return (fs::path(dir) / ("rtloop_" + std::string(GIT_SHA) + "_" + utcns + "_" + std::to_string(s) + ext)).string();
                }

                void open_new_file_(){
                    mcap_path_ = make_filename_(cfg_.out_dir, ".mcap");
                    sidecar_path_ = mcap_path_;
                    sidecar_path_.replace_extension(".sidecar.json");

                    mcap::McapWriterOptions wopt("");
                    wopt.noStatistics = true;

                    const auto st = writer_.open(mcap_path_.string(), wopt);
                    if (!st.ok()){
                        // no evidence -> recorder stays inert, the loop keeps running
                        std::fprintf(stderr, "rtloop_mcap: open failed: %s\n", st.message.c_str());
                        open_ = false;
                        return;
                    }

                    open_ = true;
                    write_err_reported_ = false;
                    last_fsync_mark_ = 0;
                    seq_ = 1;
                    cycle_seq_ = 0;
                    register_schemas_channels_();
                }

                // // close, then BLAKE3 over the finished file and the schema into the sidecar
                void close_current_(){
                    if (!open_) return;
                    writer_.close();
                    open_ = false;

                    const auto payload = hash::blake3_256_file(mcap_path_.string().c_str());
                    const auto schema = hash::blake3_256_file((fs::path(cfg_.schema_dir) / kBfbsName).string().c_str());

                    if (std::FILE* sc = std::fopen(sidecar_path_.string().c_str(), "wb")){
                        std::string j;
                        j += R"({"payload_hash":{"alg":"BLAKE3-256","value":")" + hash::to_hex({payload.data(), payload.size()}) + R"("},)";
                        j += R"("bfbs_hashes":[{"name":")" + std::string(kBfbsName) + R"(","alg":"BLAKE3-256","value":")" + hash::to_hex({schema.data(), schema.size()}) + R"("}]})";
                        const std::size_t n = std::fwrite(j.data(), 1, j.size(), sc);
                        std::fclose(sc);
                        if (n != j.size()) std::fprintf(stderr, "rtloop_mcap: short sidecar write '%s'\n", sidecar_path_.string().c_str());
                    } else {
                        std::fprintf(stderr, "rtloop_mcap: cannot write sidecar '%s'\n", sidecar_path_.string().c_str());
                    }
                }

                void register_schemas_channels_(){
                    const auto bfbs_bytes = read_file_bin((fs::path(cfg_.schema_dir) / kBfbsName).string());
                    const std::string_view bfbs(reinterpret_cast<const char*>(bfbs_bytes.data()), bfbs_bytes.size());

                    mcap::Schema s_build("rtloop.metrics.BuildInfo", "flatbuffer", bfbs);
                    mcap::Schema s_cycle("rtloop.metrics.Cycle",     "flatbuffer", bfbs);
                    mcap::Schema s_stats("rtloop.metrics.Stats",     "flatbuffer", bfbs);
                    writer_.addSchema(s_build);
                    writer_.addSchema(s_cycle);
                    writer_.addSchema(s_stats);

                    ch_build_ = add_channel_("/rtloop/buildinfo", s_build.id);
                    ch_cycle_ = add_channel_("/rtloop/cycle", s_cycle.id);
                    ch_stats_ = add_channel_("/rtloop/stats", s_stats.id);
                }

                mcap::ChannelId add_channel_(const char* topic, mcap::SchemaId sid){
                    mcap::Channel ch(topic, "flatbuffer", sid);
                    writer_.addChannel(ch);
                    return ch.id;
                }

                void rotate_segment_(){
                    close_current_();
                    open_new_file_();
                    acc_.reset();
                    prev_t_ = -1;
                }

            private:
                RecorderConfig cfg_{};

                fs::path mcap_path_{};
                fs::path sidecar_path_{};
                bool open_{false};
                bool write_err_reported_{false};

                std::uintmax_t last_fsync_mark_{0};

                long long mono_anchor_ns_{0};
                long long prev_t_{-1};          // log time of the last cycle
                std::uint64_t seq_{1};          // message sequence, per segment
                std::uint64_t cycle_seq_{0};
                std::uint64_t cycle_index_{0};  // raw counter before decimation

                mcap::McapWriter writer_;
                flatbuffers::FlatBufferBuilder builder_;
                detail::CycleAcc acc_{};

                mcap::ChannelId ch_build_{0}, ch_cycle_{0}, ch_stats_{0};
        };

        std::unique_ptr<Recorder> make_mcap_recorder(const RecorderOptions& opt){
            return std::unique_ptr<Recorder>(new RecorderMcap(opt));
        }
    #endif

} // namespace rtloop::tools
