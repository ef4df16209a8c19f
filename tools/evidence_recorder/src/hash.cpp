#include <array>
#include <vector>
#include <cstdio>

#include "hash.hpp"

extern "C"{
    #include "blake3.h"
}

namespace rtloop::tools::hash{
    std::array<std::uint8_t, 32> blake3_256(const void* data, std::size_t len){
        std::array<std::uint8_t, 32> out{};
        blake3_hasher h;
        blake3_hasher_init(&h);
        blake3_hasher_update(&h, data, len);
        blake3_hasher_finalize(&h, out.data(), out.size());
        return out;
    }

    // 64 KiB chunks, stops on read error
    std::array<std::uint8_t, 32> blake3_256_file(const char* path){
        std::FILE* f = std::fopen(path, "rb");
        if (!f) return {};
        blake3_hasher h;
        blake3_hasher_init(&h);
        std::vector<unsigned char> buf(1 << 16);
        std::size_t n = 0;
        while ((n = std::fread(buf.data(), 1, buf.size(), f)) > 0){
            blake3_hasher_update(&h, buf.data(), n);
        }
        const bool err = std::ferror(f) != 0;
        std::fclose(f);
        if (err) return {};
        std::array<std::uint8_t, 32> out{};
        blake3_hasher_finalize(&h, out.data(), out.size());
        return out;
    }

    std::string to_hex(std::span<const std::uint8_t> bytes){
        static const char* digits = "0123456789abcdef";
        std::string s;
        s.reserve(bytes.size() * 2);
        for (auto b : bytes){
            const unsigned ub = static_cast<unsigned>(b);
            s.push_back(digits[(ub >> 4) & 0x0F]);
            s.push_back(digits[ub & 0x0F]);
        }
        return s;
    }
} // namespace rtloop::tools::hash
