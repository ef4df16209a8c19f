#pragma once

#include <span>
#include <array>
#include <string>
#include <cstddef>
#include <cstdint>

namespace rtloop::tools::hash{

    // // BLAKE3-256 -> 32 byte digest; in memory and streamed from a file ({} if unreadable)
    std::array<std::uint8_t, 32> blake3_256(const void* data, std::size_t len);
    std::array<std::uint8_t, 32> blake3_256_file(const char* path);

    // // lower case hex
    std::string to_hex(std::span<const std::uint8_t> bytes);

} // namespace rtloop::tools::hash
