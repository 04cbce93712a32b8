#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "buffer.hpp"
#include "common.hpp"

namespace xblib {
    struct XBC1 {
        static constexpr std::array<char, 4> MAGIC = {'x', 'b', 'c', '1'};
        static constexpr std::size_t NAME_SIZE = 28;

        enum class Kind : std::uint32_t {
            None = 0,
            Zlib = 1,
            Zstd = 3,
        };

        struct Header {
            std::array<char, 4> magic;
            Kind kind;
            std::uint32_t uncompressed_size;
            std::uint32_t compressed_size;
            std::uint32_t checksum;
            std::array<char, NAME_SIZE> name;

            auto name_view() const noexcept -> std::string_view;
        };

        static auto check_magic(std::span<char const> data) noexcept -> bool;

        static auto kind_name(Kind kind) noexcept -> std::string_view;

        static auto parse_kind(std::string_view name) -> Kind;

        static auto default_level(Kind kind) noexcept -> int;

        // Validates magic, kind and that the declared payload fits inside data.
        static auto read_header(std::span<char const> data) -> Header;

        static auto decode(std::span<char const> data, bool verify = true) -> Buffer;

        // level 0 selects default_level(kind); name is truncated to NAME_SIZE - 1 ASCII characters.
        static auto encode(std::span<char const> data, Kind kind, int level = 0, std::string_view name = {}) -> Buffer;
    };
    static_assert(sizeof(XBC1::Header) == 48);
}

template <>
struct fmt::formatter<xblib::XBC1::Kind> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(xblib::XBC1::Kind kind, FormatContext& ctx) const {
        return formatter<std::string_view>::format(xblib::XBC1::kind_name(kind), ctx);
    }
};
