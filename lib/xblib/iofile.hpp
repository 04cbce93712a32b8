#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <utility>

namespace xblib {
    namespace fs = std::filesystem;

    // Random access byte source, implementations allow concurrent reads.
    struct IO {
        struct File;

        enum Flags : unsigned {
            READ = 0,
            WRITE = 1 << 0,
            SEQUENTIAL = 1 << 1,
            RANDOM_ACCESS = 1 << 2,
        };

        virtual ~IO() noexcept = default;

        virtual auto size() const noexcept -> std::size_t = 0;

        // False unless all of dst was filled.
        virtual auto read(std::size_t offset, std::span<char> dst) const noexcept -> bool = 0;

        // Like read but returns a view, IOError when the range is not fully available.
        virtual auto copy(std::size_t offset, std::size_t count) const -> std::span<char const> = 0;

    protected:
        IO() noexcept = default;
        IO(IO const&) = delete;
        IO& operator=(IO const&) = delete;
    };

    constexpr auto operator|(IO::Flags lhs, IO::Flags rhs) noexcept -> IO::Flags {
        return IO::Flags((unsigned)lhs | (unsigned)rhs);
    }

    struct IO::File final : IO {
        // WRITE creates the file and its parent directories, existing content is kept.
        File(fs::path const& path, Flags flags);

        File(File&& other) noexcept : fd_(std::exchange(other.fd_, -1)), size_(other.size_), flags_(other.flags_) {}

        ~File() noexcept;

        auto flags() const noexcept -> Flags { return flags_; }

        auto size() const noexcept -> std::size_t override { return size_; }

        auto read(std::size_t offset, std::span<char> dst) const noexcept -> bool override;

        auto copy(std::size_t offset, std::size_t count) const -> std::span<char const> override;

        auto truncate(std::size_t size) noexcept -> bool;

        auto write(std::size_t offset, std::span<char const> src) noexcept -> bool;

    private:
        int fd_ = -1;
        std::size_t size_ = {};
        Flags flags_ = {};
    };
}
