#pragma once

#include <cstdint>
#include <string>

namespace rtloop::tools::detail{

    struct BuildInfoPack{
        std::string rtloop_version;
        std::string git_sha;
        std::string compiler;
        std::string flags;
        std::string scalar_type;
        std::uint64_t dt_ns{0};
        std::string loop_id;
        std::string asset_id;
        std::uint32_t cycle_decimation{0};
    };

    BuildInfoPack make_buildinfo(std::uint64_t dt_ns, const char* loop_id, const char* asset_id, std::uint32_t cycle_decimation);

} // namespace rtloop::tools::detail
