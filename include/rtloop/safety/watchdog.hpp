#pragma once
#include <cstdint>

#include "rtloop/core/expected.hpp"
#include "rtloop/timing/cycle_pacer.hpp"

/*
    Goal: latch a trip when a loop misses too many deadlines in a row

    fed one outcome per cycle, counts total and consecutive misses
    trips once consecutive misses reach miss_threshold and stays tripped until reset()
    only observes: deciding what a trip means (stop, fallback, alarm) is the caller's job
 */
namespace rtloop::safety {
    class MissWatchdog {
        public:
            // // miss_threshold == 0 -> never trips, still counts
            explicit MissWatchdog(std::uint32_t miss_threshold) noexcept
            : miss_thr_(miss_threshold) {}

            void reset() noexcept{
                misses_ = 0;
                consecutive_ = 0;
                cycles_ = 0;
                tripped_ = false;
            }

            // // Returns true when tripped
            bool observe(bool missed) noexcept{
                ++cycles_;
                if (missed){
                    ++misses_;
                    ++consecutive_;
                    if (miss_thr_ != 0 && consecutive_ >= miss_thr_) tripped_ = true;
                } else {
                    consecutive_ = 0;
                }
                return tripped_;
            }

            // // any non violation error is not a miss
            bool observe(const Expected<CycleTiming>& r) noexcept{
                return observe(!r.has_value() && r.error().is_real_time_violation());
            }

            // // helper functions
            bool tripped() const noexcept{
                return tripped_;
            }
            std::uint64_t misses() const noexcept{
                return misses_;
            }
            std::uint32_t consecutive_misses() const noexcept{
                return consecutive_;
            }
            std::uint64_t cycles() const noexcept{
                return cycles_;
            }

        private:
            std::uint32_t miss_thr_{0};
            std::uint32_t consecutive_{0};
            std::uint64_t misses_{0};
            std::uint64_t cycles_{0};
            bool tripped_{false};
    };
} // namespace rtloop::safety
