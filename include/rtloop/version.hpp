#pragma once

#define RTLOOP_VERSION_MAJOR 0
#define RTLOOP_VERSION_MINOR 1
#define RTLOOP_VERSION_PATCH 0
#define RTLOOP_VERSION_STR   "0.1.0"


namespace rtloop {
    constexpr int  kVersionMajor = RTLOOP_VERSION_MAJOR;
    constexpr int  kVersionMinor = RTLOOP_VERSION_MINOR;
    constexpr int  kVersionPatch = RTLOOP_VERSION_PATCH;
    constexpr char kVersionStr[] = RTLOOP_VERSION_STR;
} // namespace rtloop

#if defined(__cplusplus)
extern "C"{
#endif
    const char* rtloop_version_string() noexcept;
#if defined(__cplusplus)
}
#endif
