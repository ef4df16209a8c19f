#include <cerrno>
#include <chrono>

#include "rtloop/core/clock.hpp"

#if defined(_WIN32)
    #include <windows.h>
    #include <thread>
#else
    #include <time.h>
    #include <sched.h>
#endif

namespace rtloop{

    #if defined(_WIN32)
        t_ns monotonic_now() noexcept{
            LARGE_INTEGER f, c;
            QueryPerformanceFrequency(&f);
            QueryPerformanceCounter(&c);
            // split to keep c * 1e9 from overflowing
            const long long q = c.QuadPart / f.QuadPart;
            const long long r = c.QuadPart % f.QuadPart;
            return static_cast<t_ns>(q * kNsPerSec + (r * kNsPerSec) / f.QuadPart);
        }

        void sleep_until(t_ns t) noexcept{
            const t_ns d = t - monotonic_now();
            if (d > 0) std::this_thread::sleep_for(std::chrono::nanoseconds(d));
        }

        void yield_now() noexcept{
            SwitchToThread();
        }
    #else
        t_ns monotonic_now() noexcept{
            timespec ts;
            clock_gettime(CLOCK_MONOTONIC, &ts);
            return static_cast<t_ns>(ts.tv_sec) * kNsPerSec + static_cast<t_ns>(ts.tv_nsec);
        }

        void sleep_until(t_ns t) noexcept{
            if (t <= 0) return;
            timespec ts;
            ts.tv_sec = static_cast<time_t>(t / kNsPerSec);
            ts.tv_nsec = static_cast<long>(t % kNsPerSec);

            // absolute deadline -> restarting after a signal does not stretch the sleep
            while (clock_nanosleep(CLOCK_MONOTONIC, TIMER_ABSTIME, &ts, nullptr) == EINTR){}
        }

        void yield_now() noexcept{
            sched_yield();
        }
    #endif

    t_ns utc_now() noexcept{
        using namespace std::chrono;
        return static_cast<t_ns>(duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
    }

} // namespace rtloop
