#pragma once
#include <cstdint>
#include <span>
#include <string_view>

namespace xblib {
    enum class FileType : std::uint8_t {
        Unknown = 0,
        BDAT = 1,
        XBC1 = 2,
    };

    // Sniffs the leading magic of a decompressed payload.
    extern auto classify(std::span<char const> data) noexcept -> FileType;

    extern auto filetype_name(FileType type) noexcept -> std::string_view;

    extern auto filetype_extension(FileType type) noexcept -> std::string_view;
}
