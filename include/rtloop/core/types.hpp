#pragma once
#include <type_traits>

namespace rtloop{
    #if defined(RTLOOP_SCALAR_FLOAT)
        // // float for embedded/aarch64 targets
        using Scalar = float;
    #else
        using Scalar = double;
        static_assert(!std::is_same_v<Scalar, float>, "use double by default");
    #endif

} // namespace rtloop
