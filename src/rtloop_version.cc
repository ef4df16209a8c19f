#include "rtloop/version.hpp"
#include "rtloop/visibility.hpp"

extern "C"{
    RTLOOP_API const char* rtloop_version_string() noexcept {
        return rtloop::kVersionStr;
    }
}
