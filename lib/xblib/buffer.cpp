#include "buffer.hpp"

#include <bit>
#include <cstring>
#include <new>

using namespace xblib;

auto Buffer::grow(std::size_t count, bool keep) noexcept -> bool {
    if (count <= capacity_) {
        return true;
    }
    auto const capacity = std::bit_ceil(count);
    if (capacity < count) [[unlikely]] {
        return false;
    }
    auto storage = std::unique_ptr<char[]>(new (std::nothrow) char[capacity]);
    if (!storage) [[unlikely]] {
        return false;
    }
    if (keep && size_ != 0) {
        std::memcpy(storage.get(), storage_.get(), size_);
    }
    storage_ = std::move(storage);
    capacity_ = capacity;
    return true;
}

auto Buffer::reserve(std::size_t count) noexcept -> bool { return grow(count, true); }

auto Buffer::resize(std::size_t count) noexcept -> bool {
    if (!grow(count, true)) [[unlikely]] {
        return false;
    }
    size_ = count;
    return true;
}

auto Buffer::reset(std::size_t count) noexcept -> bool {
    if (!grow(count, false)) [[unlikely]] {
        return false;
    }
    size_ = count;
    return true;
}

auto Buffer::append(std::span<char const> src) noexcept -> bool {
    auto const offset = size_;
    if (offset + src.size() < offset || !resize(offset + src.size())) [[unlikely]] {
        return false;
    }
    if (!src.empty()) {
        std::memcpy(storage_.get() + offset, src.data(), src.size());
    }
    return true;
}
