#pragma once
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>

namespace xblib {
    // Owned, growable byte storage for decoded entries, encoded containers and serialized indices.
    struct Buffer {
        Buffer() = default;
        Buffer(Buffer const&) = delete;
        Buffer(Buffer&& other) noexcept
            : storage_(std::move(other.storage_)),
              size_(std::exchange(other.size_, 0)),
              capacity_(std::exchange(other.capacity_, 0)) {}
        Buffer& operator=(Buffer&& other) noexcept {
            storage_ = std::move(other.storage_);
            size_ = std::exchange(other.size_, 0);
            capacity_ = std::exchange(other.capacity_, 0);
            return *this;
        }

        operator std::span<char>() noexcept { return {storage_.get(), size_}; }
        operator std::span<char const>() const noexcept { return {storage_.get(), size_}; }

        auto data() noexcept -> char* { return storage_.get(); }
        auto data() const noexcept -> char const* { return storage_.get(); }
        auto size() const noexcept -> std::size_t { return size_; }
        auto empty() const noexcept -> bool { return size_ == 0; }

        auto subspan(std::size_t off, std::size_t count = std::dynamic_extent) noexcept -> std::span<char> {
            return std::span<char>(*this).subspan(off, count);
        }
        auto subspan(std::size_t off, std::size_t count = std::dynamic_extent) const noexcept
            -> std::span<char const> {
            return std::span<char const>(*this).subspan(off, count);
        }

        // Grows capacity, contents are kept.
        [[nodiscard]] auto reserve(std::size_t count) noexcept -> bool;

        // Sets the size, contents up to the new size are kept.
        [[nodiscard]] auto resize(std::size_t count) noexcept -> bool;

        // Sets the size, previous contents are undefined afterwards.
        [[nodiscard]] auto reset(std::size_t count) noexcept -> bool;

        [[nodiscard]] auto append(std::span<char const> src) noexcept -> bool;

        template <typename T>
            requires(std::is_trivially_copyable_v<T>)
        [[nodiscard]] auto append_s(T const& value) noexcept -> bool {
            return append({reinterpret_cast<char const*>(&value), sizeof(T)});
        }

    private:
        auto grow(std::size_t count, bool keep) noexcept -> bool;

        std::unique_ptr<char[]> storage_;
        std::size_t size_ = {};
        std::size_t capacity_ = {};
    };
}
