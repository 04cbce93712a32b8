#include "xbc1.hpp"

#include <miniz.h>
#include <zstd.h>

#include <bit>
#include <limits>

#include "checksum.hpp"

using namespace xblib;

static_assert(std::endian::native == std::endian::little);

auto XBC1::Header::name_view() const noexcept -> std::string_view {
    auto const end = std::find(name.begin(), name.end(), '\0');
    return {name.data(), (std::size_t)(end - name.begin())};
}

auto XBC1::check_magic(std::span<char const> data) noexcept -> bool {
    return data.size() >= MAGIC.size() && std::memcmp(data.data(), MAGIC.data(), MAGIC.size()) == 0;
}

auto XBC1::kind_name(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::None:
            return "none";
        case Kind::Zlib:
            return "zlib";
        case Kind::Zstd:
            return "zstd";
    }
    return "unknown";
}

auto XBC1::parse_kind(std::string_view name) -> Kind {
    if (name == "none" || name == "0") {
        return Kind::None;
    }
    if (name == "zlib" || name == "1") {
        return Kind::Zlib;
    }
    if (name == "zstd" || name == "3") {
        return Kind::Zstd;
    }
    xblib_error(Errc::Format, "Unknown compression kind!");
}

auto XBC1::default_level(Kind kind) noexcept -> int {
    switch (kind) {
        case Kind::Zlib:
            return MZ_BEST_COMPRESSION;
        case Kind::Zstd:
            return ZSTD_maxCLevel();
        default:
            return 0;
    }
}

auto XBC1::read_header(std::span<char const> data) -> Header {
    auto header = Header{};
    xblib_assert(data.size() >= sizeof(Header));
    std::memcpy(&header, data.data(), sizeof(Header));
    xblib_assert(header.magic == MAGIC);
    xblib_assert(header.kind == Kind::None || header.kind == Kind::Zlib || header.kind == Kind::Zstd);
    xblib_assert(data.size() - sizeof(Header) >= header.compressed_size);
    if (header.kind == Kind::None) {
        xblib_assert(header.compressed_size == header.uncompressed_size);
    }
    return header;
}

auto XBC1::decode(std::span<char const> data, bool verify) -> Buffer {
    auto const header = read_header(data);
    xblib_trace("xbc1: {}", header.name_view());
    auto const src = data.subspan(sizeof(Header), header.compressed_size);
    auto result = Buffer{};
    xblib_assert_errc(Errc::IO, result.reserve(std::max(std::size_t{1}, (std::size_t)header.uncompressed_size)));
    xblib_assert_errc(Errc::IO, result.resize(header.uncompressed_size));
    auto size = std::size_t{};
    switch (header.kind) {
        case Kind::None:
            std::copy(src.begin(), src.end(), result.data());
            size = src.size();
            break;
        case Kind::Zlib: {
            auto dst_size = (mz_ulong)result.size();
            xblib_assert_mz(mz_uncompress((unsigned char*)result.data(),
                                          &dst_size,
                                          (unsigned char const*)src.data(),
                                          (mz_ulong)src.size()));
            size = (std::size_t)dst_size;
            break;
        }
        case Kind::Zstd:
            size = xblib_assert_zstd(ZSTD_decompress(result.data(), result.size(), src.data(), src.size()));
            break;
    }
    xblib_assert_errc(Errc::Integrity, size == header.uncompressed_size);
    if (verify) {
        xblib_assert_errc(Errc::Integrity, checksum32(result) == header.checksum);
    }
    return result;
}

auto XBC1::encode(std::span<char const> data, Kind kind, int level, std::string_view name) -> Buffer {
    xblib_assert(data.size() <= std::numeric_limits<std::uint32_t>::max());
    if (level == 0) {
        level = default_level(kind);
    }
    auto header = Header{
        .magic = MAGIC,
        .kind = kind,
        .uncompressed_size = (std::uint32_t)data.size(),
        .compressed_size = {},
        .checksum = checksum32(data),
        .name = {},
    };
    for (std::size_t i = 0; auto c : name) {
        if (i == NAME_SIZE - 1) {
            break;
        }
        if ((std::uint8_t)c < 0x80) {
            header.name[i++] = c;
        }
    }

    auto result = Buffer{};
    auto bound = std::size_t{};
    switch (kind) {
        case Kind::None:
            bound = data.size();
            break;
        case Kind::Zlib:
            bound = (std::size_t)mz_compressBound((mz_ulong)data.size());
            break;
        case Kind::Zstd:
            bound = ZSTD_compressBound(data.size());
            break;
        default:
            xblib_error(Errc::Format, "Unknown compression kind!");
    }
    xblib_assert_errc(Errc::IO, result.reset(sizeof(Header) + bound));
    auto dst = result.subspan(sizeof(Header));
    auto size = std::size_t{};
    switch (kind) {
        case Kind::None:
            std::copy(data.begin(), data.end(), dst.data());
            size = data.size();
            break;
        case Kind::Zlib: {
            auto dst_size = (mz_ulong)dst.size();
            xblib_assert_mz(mz_compress2((unsigned char*)dst.data(),
                                         &dst_size,
                                         (unsigned char const*)data.data(),
                                         (mz_ulong)data.size(),
                                         level));
            size = (std::size_t)dst_size;
            break;
        }
        case Kind::Zstd:
            size = xblib_assert_zstd(ZSTD_compress(dst.data(), dst.size(), data.data(), data.size(), level));
            break;
    }
    xblib_assert(size <= std::numeric_limits<std::uint32_t>::max());
    header.compressed_size = (std::uint32_t)size;
    std::memcpy(result.data(), &header, sizeof(Header));
    xblib_assert_errc(Errc::IO, result.resize(sizeof(Header) + size));
    return result;
}
