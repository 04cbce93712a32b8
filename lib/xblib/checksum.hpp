#pragma once
#include <cstdint>
#include <span>

namespace xblib {
    // Digest stored in XBC1 headers: unsigned byte sum, wrapping at 32 bits.
    extern auto checksum32(std::span<char const> data) noexcept -> std::uint32_t;
}
