#include "ard.hpp"

#include <bit>

using namespace xblib;

auto ARD::read_range(IO const& io, std::uint64_t offset, std::size_t count) -> std::span<char const> {
    xblib_trace("range: {:#x}:+{:#x}", offset, count);
    xblib_assert_io(in_range(offset, count, io.size()));
    return io.copy(offset, count);
}

ARD::Writer::Writer(fs::path const& path, std::uint32_t alignment)
    : file_(path, IO::WRITE | IO::SEQUENTIAL), alignment_(alignment) {
    xblib_assert(alignment_ != 0 && std::has_single_bit(alignment_));
    xblib_assert_io(file_.truncate(0));
}

auto ARD::Writer::append(std::span<char const> data) -> Appended {
    static constexpr char const ZEROS[256] = {};
    auto const offset = cursor_;
    xblib_assert_io(file_.write(offset, data));
    auto const end = offset + data.size();
    auto const next = align_up(end, alignment_);
    for (auto pos = end; pos != next;) {
        auto const count = std::min(next - pos, (std::uint64_t)sizeof(ZEROS));
        xblib_assert_io(file_.write(pos, {ZEROS, count}));
        pos += count;
    }
    cursor_ = next;
    return {.offset = offset, .cursor = cursor_};
}
