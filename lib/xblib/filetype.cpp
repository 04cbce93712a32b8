#include "filetype.hpp"

#include <cstring>

#include "xbc1.hpp"

using namespace xblib;

auto xblib::classify(std::span<char const> data) noexcept -> FileType {
    if (data.size() >= 4 && std::memcmp(data.data(), "BDAT", 4) == 0) {
        return FileType::BDAT;
    }
    if (XBC1::check_magic(data)) {
        return FileType::XBC1;
    }
    return FileType::Unknown;
}

auto xblib::filetype_name(FileType type) noexcept -> std::string_view {
    switch (type) {
        case FileType::BDAT:
            return "bdat";
        case FileType::XBC1:
            return "xbc1";
        default:
            return "unknown";
    }
}

auto xblib::filetype_extension(FileType type) noexcept -> std::string_view {
    switch (type) {
        case FileType::BDAT:
            return ".bdat";
        case FileType::XBC1:
            return ".xbc1";
        default:
            return ".dec";
    }
}
