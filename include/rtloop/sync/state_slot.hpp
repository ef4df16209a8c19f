#pragma once

#include <atomic>
#include <cstdint>
#include <utility>
#include <optional>
#include <type_traits>
#include <mutex>
#include <shared_mutex>

#include "rtloop/core/error.hpp"
#include "rtloop/core/expected.hpp"

/*
Goal: hand the latest sample from one writer thread to any number of reader threads

    payload          -> guarded by a reader/writer lock (readers never serialize against each other)
    timestamp, valid -> atomics, published with release after the payload, checked with acquire by readers

    publish protocol:
        writer: [exclusive lock] payload = v; timestamp.store(t, release); valid.store(true, release) [unlock]
        reader: valid.load(acquire) == false -> nothing; else [shared lock] copy payload + timestamp.load(acquire)
    -> a reader that sees valid == true never sees an unwritten payload, and the copied
       (payload, timestamp) pair always comes from the same write (no tearing)

    latched: once valid, always valid. Staleness is judged by the caller from the timestamp
    one logical writer at a time; concurrent writers are memory safe but their ordering is unspecified
*/
namespace rtloop{

    template <class T>
    struct Sample{
        T value;
        std::int64_t timestamp;
    };

    template <class T>
    class StateSlot{
        static_assert(std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>,
                      "StateSlot payload must be copyable");
        static_assert(std::is_default_constructible_v<T>, "StateSlot payload must be default constructible");

        public:
            StateSlot() = default;

            StateSlot(const StateSlot&) = delete;
            StateSlot& operator=(const StateSlot&) = delete;

            void write(const T& value, std::int64_t timestamp){
                std::unique_lock<std::shared_mutex> lk(mtx_);
                payload_ = value;
                timestamp_.store(timestamp, std::memory_order_release);
                valid_.store(true, std::memory_order_release);
            }

            [[nodiscard]] std::optional<Sample<T>> read() const{
                if (!valid_.load(std::memory_order_acquire)) return std::nullopt;

                std::shared_lock<std::shared_mutex> lk(mtx_);
                return Sample<T>{payload_, timestamp_.load(std::memory_order_acquire)};
            }

            [[nodiscard]] bool is_valid() const noexcept{
                return valid_.load(std::memory_order_acquire);
            }

            // // lock free metadata peek, nullopt until the first write
            [[nodiscard]] std::optional<std::int64_t> timestamp() const noexcept{
                if (!valid_.load(std::memory_order_acquire)) return std::nullopt;
                return timestamp_.load(std::memory_order_acquire);
            }

        private:
            mutable std::shared_mutex mtx_;
            T payload_{};
            std::atomic<std::int64_t> timestamp_{0};
            std::atomic<bool> valid_{false};
    };

    // // Promote "no sample yet" to SensorDataUnavailable for callers that treat absence as an error
    template <class T>
    [[nodiscard]] Expected<Sample<T>> require(const StateSlot<T>& slot){
        auto s = slot.read();
        if (!s) return Expected<Sample<T>>::failure(Error::sensor_data_unavailable());
        return Expected<Sample<T>>::success(std::move(*s));
    }

} // namespace rtloop
