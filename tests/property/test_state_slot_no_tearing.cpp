#include <atomic>
#include <thread>
#include <vector>
#include <cassert>
#include <cstdint>

#include "rtloop/sync/state_slot.hpp"

using namespace rtloop;

// // every field derived from one sequence number -> a torn copy breaks the relation
struct Frame{
    std::int64_t seq{0};
    double a{0.0};
    double b{0.0};
    std::int64_t c{0};
    char tag[40]{};
};

static Frame make_frame(std::int64_t s){
    Frame f;
    f.seq = s;
    f.a = static_cast<double>(s) * 0.5;
    f.b = -static_cast<double>(s);
    f.c = s ^ 0x5a5a5a5a;
    for (std::size_t i=0; i<sizeof(f.tag); ++i) f.tag[i] = static_cast<char>('a' + (s + static_cast<std::int64_t>(i)) % 26);
    return f;
}

static bool consistent(const Sample<Frame>& s){
    const Frame ref = make_frame(s.value.seq);
    if (s.timestamp != s.value.seq * 10) return false;
    if (s.value.a != ref.a || s.value.b != ref.b || s.value.c != ref.c) return false;
    for (std::size_t i=0; i<sizeof(ref.tag); ++i){
        if (s.value.tag[i] != ref.tag[i]) return false;
    }
    return true;
}

int main(){
    StateSlot<Frame> slot;
    std::atomic<bool> stop{false};
    std::atomic<std::uint64_t> bad{0}, seen{0};

    constexpr int kReaders = 4;
    std::vector<std::thread> readers;
    readers.reserve(kReaders);

    for (int r=0; r<kReaders; ++r){
        readers.emplace_back([&]{
            std::int64_t last_seq = -1;
            while (!stop.load(std::memory_order_acquire)){
                auto s = slot.read();
                if (!s) continue;
                if (!consistent(*s)) bad.fetch_add(1, std::memory_order_relaxed);
                // single writer, increasing seq: a reader never sees time go backwards
                if (s->value.seq < last_seq) bad.fetch_add(1, std::memory_order_relaxed);
                last_seq = s->value.seq;
                seen.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    std::thread writer([&]{
        for (std::int64_t s=0; s<200'000; ++s) slot.write(make_frame(s), s * 10);
        stop.store(true, std::memory_order_release);
    });

    writer.join();
    for (auto& t : readers) t.join();

    assert(bad.load() == 0);
    assert(slot.is_valid());
    auto last = slot.read();
    assert(last && last->value.seq == 199'999 && last->timestamp == 1'999'990);
    (void)seen;
    return 0;
}
