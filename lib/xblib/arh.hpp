#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "buffer.hpp"
#include "common.hpp"
#include "filetype.hpp"
#include "iofile.hpp"

namespace xblib {
    struct ARH {
        static constexpr std::array<char, 4> MAGIC = {'a', 'r', 'h', '2'};
        static constexpr std::uint32_t NO_NAME = 0xFFFFFFFF;
        static constexpr std::uint32_t DEFAULT_ALIGNMENT = 16;

        enum class Storage : std::uint8_t {
            Raw = 0,
            XBC1 = 1,
            // Only produced for legacy indices, decided by the stored bytes when extracted.
            Detect = 2,
        };

        // Original 16 byte header, records are {id, stored size, container size} laid out back to back
        // in the ARD with 16 byte alignment.
        struct LegacyHeader {
            std::array<char, 4> magic;
            std::uint32_t entry_count;
            std::uint32_t entries_offset;
            std::uint32_t reserved;
        };

        struct LegacyRecord {
            std::uint64_t id;
            std::uint32_t stored_size;
            std::uint32_t container_size;
        };

        struct Header {
            std::array<char, 4> magic;
            std::uint32_t entry_count;
            std::uint32_t entries_offset;
            std::uint32_t entry_size;
            std::uint32_t names_offset;
            std::uint32_t names_size;
            std::uint32_t alignment;
            std::uint32_t reserved;
        };

        struct Entry {
            struct Raw;

            std::uint32_t index;
            std::uint64_t offset;
            std::uint32_t stored_size;
            std::uint32_t uncompressed_size;
            std::uint64_t id;
            std::string name;
            Storage storage;
            FileType type;
        };

        using filter_cb = function_ref<bool(Entry const& entry)>;

        std::uint32_t alignment = DEFAULT_ALIGNMENT;
        std::vector<Entry> entries;

        static auto read(IO const& io) -> ARH;

        // Validates every offset and size against data, FormatError on any violation.
        // Legacy indices are accepted and yield unnamed entries with Storage::Detect.
        static auto parse(std::span<char const> data) -> ARH;

        static auto storage_name(Storage storage) noexcept -> std::string_view;

        // Always the current layout, entries with Storage::Detect are rejected.
        auto write() const -> Buffer;

        // Entries accepted by filter, in index order, with their original indices.
        auto filter(filter_cb filter) const -> std::vector<Entry>;

    private:
        static auto parse_legacy(std::span<char const> data) -> ARH;
    };

    struct ARH::Entry::Raw {
        std::uint64_t offset;
        std::uint32_t stored_size;
        std::uint32_t uncompressed_size;
        std::uint64_t id;
        std::uint32_t name_offset;
        Storage storage;
        FileType type;
        std::uint16_t reserved;
    };

    static_assert(sizeof(ARH::Header) == 32);
    static_assert(sizeof(ARH::Entry::Raw) == 32);
    static_assert(sizeof(ARH::LegacyHeader) == 16);
    static_assert(sizeof(ARH::LegacyRecord) == 16);
}
