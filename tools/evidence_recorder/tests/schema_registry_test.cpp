#include <string>
#include <cstdio>
#include <cassert>
#include <filesystem>

#include "rtloop/timing/rt_stats.hpp"
#include "rtloop/tools/recorder.hpp"

int main(){
    #if !RTLOOP_RECORDER_BACKEND_MCAP
        return 0;
    #else

    namespace fs = std::filesystem;

    fs::remove_all("evidence_schema");
    fs::create_directories("evidence_schema");

    rtloop::tools::RecorderOptions opt;
    opt.out_dir = "evidence_schema";
    opt.dt_ns_hint = 1000000;

    {
        auto rec = rtloop::tools::Recorder::open(opt);
        rec->write_time_anchor(1, 2);
        rec->write_buildinfo();

        rtloop::tools::CycleSample s{};
        s.t = 10;
        s.period = 1000000;
        rec->write_cycle(s);
        rec->write_stats(rtloop::RtStats{});
        rec->flush();
    }

    fs::path latest;
    for (auto& e: fs::directory_iterator("evidence_schema")){
        if (e.path().extension() == ".mcap") latest = e.path();
    }
    assert(!latest.empty());

    // schema names and channel topics are stored as plain strings in the summary records
    std::FILE* f = std::fopen(latest.string().c_str(), "rb");
    assert(f);
    std::string bytes;
    char buf[4096];
    std::size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) bytes.append(buf, n);
    std::fclose(f);

    assert(bytes.find("rtloop.metrics.Cycle") != std::string::npos);
    assert(bytes.find("rtloop.metrics.Stats") != std::string::npos);
    assert(bytes.find("/rtloop/cycle") != std::string::npos);
    assert(bytes.find("/rtloop/buildinfo") != std::string::npos);

    return 0;
    #endif
}
