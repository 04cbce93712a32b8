#pragma once
#include <cstdint>
#include <span>

#include "common.hpp"
#include "iofile.hpp"

namespace xblib {
    struct ARD {
        struct Appended {
            std::uint64_t offset;
            std::uint64_t cursor;
        };

        struct Writer;

        // Exactly count bytes at offset, IOError on a short read. Safe to call from several threads.
        static auto read_range(IO const& io, std::uint64_t offset, std::size_t count) -> std::span<char const>;
    };

    // Sole owner of an ARD being constructed, appends are not synchronized.
    struct ARD::Writer {
        Writer(fs::path const& path, std::uint32_t alignment);

        auto append(std::span<char const> data) -> Appended;

        auto cursor() const noexcept -> std::uint64_t { return cursor_; }

        auto alignment() const noexcept -> std::uint32_t { return alignment_; }

    private:
        IO::File file_;
        std::uint32_t alignment_;
        std::uint64_t cursor_ = {};
    };
}
