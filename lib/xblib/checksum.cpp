#include "checksum.hpp"

#include <numeric>

using namespace xblib;

auto xblib::checksum32(std::span<char const> data) noexcept -> std::uint32_t {
    return std::accumulate(data.begin(), data.end(), std::uint32_t{}, [](std::uint32_t sum, char c) {
        return sum + (std::uint8_t)c;
    });
}
