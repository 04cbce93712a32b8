#include "arh.hpp"

#include <bit>
#include <cstring>

using namespace xblib;

auto ARH::read(IO const& io) -> ARH { return parse(io.copy(0, io.size())); }

auto ARH::parse_legacy(std::span<char const> data) -> ARH {
    auto header = LegacyHeader{};
    std::memcpy(&header, data.data(), sizeof(LegacyHeader));
    auto const toc_size = (std::uint64_t)header.entry_count * sizeof(LegacyRecord);
    xblib_assert(in_range(header.entries_offset, toc_size, data.size()));

    auto result = ARH{.alignment = DEFAULT_ALIGNMENT, .entries = {}};
    result.entries.reserve(header.entry_count);
    auto offset = std::uint64_t{};
    for (std::uint32_t i = 0; i != header.entry_count; ++i) {
        auto record = LegacyRecord{};
        std::memcpy(&record, data.data() + header.entries_offset + (std::size_t)i * sizeof(LegacyRecord), sizeof(record));
        result.entries.push_back(Entry{
            .index = i,
            .offset = offset,
            .stored_size = record.stored_size,
            .uncompressed_size = 0,
            .id = record.id,
            .name = {},
            .storage = Storage::Detect,
            .type = FileType::Unknown,
        });
        offset = align_up(offset + record.stored_size, DEFAULT_ALIGNMENT);
    }
    return result;
}

auto ARH::parse(std::span<char const> data) -> ARH {
    auto result = ARH{};

    if (data.size() >= sizeof(LegacyHeader)) {
        auto legacy = LegacyHeader{};
        std::memcpy(&legacy, data.data(), sizeof(LegacyHeader));
        if (legacy.magic == MAGIC && legacy.entries_offset == sizeof(LegacyHeader) && legacy.reserved == 0) {
            return parse_legacy(data);
        }
    }

    auto header = Header{};
    xblib_assert(data.size() >= sizeof(Header));
    std::memcpy(&header, data.data(), sizeof(Header));
    xblib_assert(header.magic == MAGIC);
    xblib_assert(header.alignment != 0 && std::has_single_bit(header.alignment));
    xblib_assert(header.entry_size >= sizeof(Entry::Raw));
    xblib_assert(header.entries_offset >= sizeof(Header));

    auto const toc_size = (std::uint64_t)header.entry_count * header.entry_size;
    xblib_assert(in_range(header.entries_offset, toc_size, data.size()));

    auto names = std::string_view{};
    if (header.names_offset != 0) {
        xblib_assert(header.names_offset >= sizeof(Header));
        xblib_assert(in_range(header.names_offset, header.names_size, data.size()));
        names = std::string_view(data.data() + header.names_offset, header.names_size);
    }

    result.alignment = header.alignment;
    result.entries.reserve(header.entry_count);
    for (std::uint32_t i = 0; i != header.entry_count; ++i) {
        xblib_trace("entry: {}", i);
        auto raw = Entry::Raw{};
        std::memcpy(&raw, data.data() + header.entries_offset + (std::size_t)i * header.entry_size, sizeof(raw));
        xblib_assert(raw.storage == Storage::Raw || raw.storage == Storage::XBC1);
        auto entry = Entry{
            .index = i,
            .offset = raw.offset,
            .stored_size = raw.stored_size,
            .uncompressed_size = raw.uncompressed_size,
            .id = raw.id,
            .name = {},
            .storage = raw.storage,
            .type = raw.type,
        };
        if (raw.name_offset != NO_NAME) {
            xblib_assert(raw.name_offset < names.size());
            auto const end = names.find('\0', raw.name_offset);
            xblib_assert(end != std::string_view::npos);
            entry.name = std::string(names.substr(raw.name_offset, end - raw.name_offset));
        }
        result.entries.push_back(std::move(entry));
    }
    return result;
}

auto ARH::write() const -> Buffer {
    xblib_assert(alignment != 0 && std::has_single_bit(alignment));
    xblib_assert(entries.size() < NO_NAME);

    auto names = std::string{};
    auto raws = std::vector<Entry::Raw>{};
    raws.reserve(entries.size());
    for (std::uint32_t i = 0; auto const& entry : entries) {
        xblib_assert(entry.index == i++);
        xblib_assert(entry.storage == Storage::Raw || entry.storage == Storage::XBC1);
        auto name_offset = NO_NAME;
        if (!entry.name.empty()) {
            xblib_assert(entry.name.find('\0') == std::string::npos);
            name_offset = (std::uint32_t)names.size();
            names += entry.name;
            names.push_back('\0');
            xblib_assert(names.size() < NO_NAME);
        }
        raws.push_back(Entry::Raw{
            .offset = entry.offset,
            .stored_size = entry.stored_size,
            .uncompressed_size = entry.uncompressed_size,
            .id = entry.id,
            .name_offset = name_offset,
            .storage = entry.storage,
            .type = entry.type,
            .reserved = {},
        });
    }

    auto const toc_size = sizeof(Entry::Raw) * raws.size();
    auto const header = Header{
        .magic = MAGIC,
        .entry_count = (std::uint32_t)raws.size(),
        .entries_offset = sizeof(Header),
        .entry_size = sizeof(Entry::Raw),
        .names_offset = names.empty() ? 0 : (std::uint32_t)(sizeof(Header) + toc_size),
        .names_size = (std::uint32_t)names.size(),
        .alignment = alignment,
        .reserved = {},
    };
    xblib_assert(sizeof(Header) + toc_size + names.size() <= 0xFFFFFFFFull);

    auto result = Buffer{};
    xblib_assert_errc(Errc::IO, result.append_s(header));
    xblib_assert_errc(Errc::IO, result.append({(char const*)raws.data(), toc_size}));
    xblib_assert_errc(Errc::IO, result.append(names));
    return result;
}

auto ARH::storage_name(Storage storage) noexcept -> std::string_view {
    switch (storage) {
        case Storage::Raw:
            return "raw";
        case Storage::XBC1:
            return "xbc1";
        case Storage::Detect:
            return "detect";
    }
    return "unknown";
}

auto ARH::filter(filter_cb filter) const -> std::vector<Entry> {
    auto result = std::vector<Entry>{};
    for (auto const& entry : entries) {
        if (!filter || filter(entry)) {
            result.push_back(entry);
        }
    }
    return result;
}
