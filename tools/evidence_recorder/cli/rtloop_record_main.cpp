#include <cstdio>
#include <string>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include "rtloop/core/time.hpp"
#include "rtloop/core/clock.hpp"
#include "rtloop/timing/rt_stats.hpp"
#include "rtloop/tools/recorder.hpp"

namespace fs = std::filesystem;
using namespace rtloop;
using namespace rtloop::tools;

// // Single stderr print flags and CSV
static void usage(){
    std::fprintf(
        stderr,
        "rtloop_record --out <dir> --schema-dir <dir> --cycle-decim N "
        "--segment-max-mb 256 --fsync-policy {every_segment|every_n_mb} --fsync-n-mb 16 "
        "--dt-ns <n> --loop-id <str> --asset-id <str> --stdin-csv\n"
        "CSV (if --stdin-csv): t_ns,latency_ns,period_ns,setpoint,measured,output\n"
    );
}

int main(int argc, char** argv){
    // // Configs
    const char* out_dir = "evidence";
    const char* schema_dir = RTLOOP_FB_SCHEMA_DIR;
    int cycle_decim = 1;
    int segment_mb = 256;
    const char* fsync_policy = "every_n_mb";
    int fsync_n_mb = 16;
    bool stdin_csv = false;
    long long dt_ns_hint = 0;
    const char* loop_id = "";
    const char* asset_id = "";

    for (int i=1; i<argc; i++){
        if (!std::strcmp(argv[i], "--out") && i+1<argc) out_dir = argv[++i];
        else if (!std::strcmp(argv[i], "--schema-dir") && i+1<argc) schema_dir = argv[++i];
        else if (!std::strcmp(argv[i], "--cycle-decim") && i+1<argc) cycle_decim = std::atoi(argv[++i]);
        else if (!std::strcmp(argv[i], "--segment-max-mb") && i+1<argc) segment_mb = std::atoi(argv[++i]);
        else if (!std::strcmp(argv[i], "--fsync-policy") && i+1<argc) fsync_policy = argv[++i];
        else if (!std::strcmp(argv[i], "--fsync-n-mb") && i+1<argc) fsync_n_mb = std::atoi(argv[++i]);
        else if (!std::strcmp(argv[i], "--dt-ns") && i+1<argc) dt_ns_hint = std::atoll(argv[++i]);
        else if (!std::strcmp(argv[i], "--loop-id") && i+1<argc) loop_id = argv[++i];
        else if (!std::strcmp(argv[i], "--asset-id") && i+1<argc) asset_id = argv[++i];
        else if (!std::strcmp(argv[i], "--stdin-csv")) stdin_csv = true;
        else{
            usage();
            return 2;
        }
    }

    {
        std::error_code ec;
        fs::create_directories(out_dir, ec);
        if (ec) std::fprintf(stderr, "rtloop_record: warn: create_directories(%s): %s\n",
                             out_dir, ec.message().c_str());
    }

    RecorderOptions opt;
    opt.out_dir = out_dir;
    opt.schema_dir = schema_dir;
    opt.segment_max_mb = (segment_mb > 0) ? static_cast<std::size_t>(segment_mb) : 256;
    opt.fsync_n_mb = (fsync_n_mb > 0) ? static_cast<std::size_t>(fsync_n_mb) : 16;
    opt.cycle_decimation = (cycle_decim > 0) ? cycle_decim : 1;
    opt.fsync_policy = (
        std::strcmp(fsync_policy, "every_segment") == 0 ?
        RecorderOptions::EverySegment : RecorderOptions::EveryNMB
    );
    opt.dt_ns_hint = dt_ns_hint;
    opt.loop_id = loop_id;
    opt.asset_id = asset_id;

    auto rec = Recorder::open(opt);
    rec->write_buildinfo();
    rec->write_time_anchor(monotonic_now(), utc_now());

    // stats rebuilt from the replayed rows, same update rule as the pacer
    RtStats stats{};
    if (stdin_csv){
        char line[256];
        std::uint64_t row = 0;
        while (std::fgets(line, sizeof(line), stdin)){
            line[std::strcspn(line, "\r\n")] = 0;

            long long t=0, latency=0, period=0;
            double sp=0, y=0, u=0;
            const int n = std::sscanf(
                line, " %lld , %lld , %lld , %lf , %lf , %lf",
                &t, &latency, &period, &sp, &y, &u
            );
            if (n != 6) continue;

            CycleSample s;
            s.t = t;
            s.cycle_index = ++row;
            s.latency = latency;
            s.period = period;
            s.violation = latency > period;
            s.setpoint = sp;
            s.measured = y;
            s.output = u;

            stats.update(latency, period);
            rec->write_cycle(s);
        }
    }

    rec->write_stats(stats);
    rec->flush();
    return 0;
}
