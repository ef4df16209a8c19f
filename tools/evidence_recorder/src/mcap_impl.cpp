// single translation unit carrying the mcap header-only implementation
#define MCAP_IMPLEMENTATION

#if defined(__GNUC__)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wshadow"
#endif

#include <mcap/writer.hpp>

#if defined(__GNUC__)
    #pragma GCC diagnostic pop
#endif
