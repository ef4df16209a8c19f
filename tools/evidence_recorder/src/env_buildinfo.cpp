#include <cstdio>
#include <string>

#include "env_buildinfo.hpp"
#include "rtloop/version.hpp"
#include "rtloop/core/types.hpp"

#ifndef GIT_SHA
#define GIT_SHA "unknown"
#endif

/*
Goal: describe the binary that produced a recording, enough to tell two timing runs apart

    compiler : "<family> <major>.<minor>.<patch>"
    flags    : space separated tokens, fixed order
               backend  (mcap | jsonl)
               std      (c++17 | c++20 | c++23)
               rt       (linux-rt | no-rt)        <- whether os::RtThreadConfig can act at all
               math     (fast-math | strict-math)
               build    (release | debug)
*/
namespace rtloop::tools::detail{
    namespace{
        std::string compiler_id(){
            char buf[48];
            #if defined(__clang__)
                std::snprintf(buf, sizeof(buf), "clang %d.%d.%d", __clang_major__, __clang_minor__, __clang_patchlevel__);
            #elif defined(__GNUC__)
                std::snprintf(buf, sizeof(buf), "gcc %d.%d.%d", __GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__);
            #elif defined(_MSC_VER)
                std::snprintf(buf, sizeof(buf), "msvc %d", _MSC_VER);
            #else
                std::snprintf(buf, sizeof(buf), "unknown");
            #endif
            return buf;
        }

        const char* language_standard(){
            if (__cplusplus > 202002L) return "c++23";
            if (__cplusplus >= 202002L) return "c++20";
            return "c++17";
        }

        void append_token(std::string& out, const char* tok){
            if (!out.empty()) out += ' ';
            out += tok;
        }

        std::string timing_flags(){
            std::string out;
            #if defined(RTLOOP_RECORDER_BACKEND_MCAP) && RTLOOP_RECORDER_BACKEND_MCAP
                append_token(out, "mcap");
            #else
                append_token(out, "jsonl");
            #endif

            append_token(out, language_standard());

            #if defined(__linux__)
                append_token(out, "linux-rt");
            #else
                append_token(out, "no-rt");
            #endif

            #if defined(__FAST_MATH__)
                append_token(out, "fast-math");
            #else
                append_token(out, "strict-math");
            #endif

            #ifdef NDEBUG
                append_token(out, "release");
            #else
                append_token(out, "debug");
            #endif
            return out;
        }
    } // namespace

    BuildInfoPack make_buildinfo(std::uint64_t dt_ns, const char* loop_id, const char* asset_id, std::uint32_t cycle_decimation){
        BuildInfoPack bi;
        bi.rtloop_version   = kVersionStr;
        bi.git_sha          = GIT_SHA;
        bi.compiler         = compiler_id();
        bi.flags            = timing_flags();
        bi.scalar_type      = (sizeof(Scalar) == sizeof(float)) ? "float" : "double";
        bi.dt_ns            = dt_ns;
        bi.loop_id          = (loop_id != nullptr) ? loop_id : "";
        bi.asset_id         = (asset_id != nullptr) ? asset_id : "";
        bi.cycle_decimation = cycle_decimation;
        return bi;
    }
} // namespace rtloop::tools::detail
