#include "iofile.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "common.hpp"

using namespace xblib;

[[noreturn]] static void throw_errno(char const* from) {
    throw_error(Errc::IO, from, std::error_code((int)errno, std::system_category()));
}

IO::File::File(fs::path const& path, Flags flags) {
    xblib_trace("path: {}", path.generic_string());
    if ((flags & WRITE) && path.has_parent_path()) {
        xblib_rethrow(fs::create_directories(path.parent_path()));
    }
    auto const mode = (flags & WRITE) ? O_RDWR | O_CREAT | O_CLOEXEC : O_RDONLY | O_CLOEXEC;
    auto const fd = ::open(path.c_str(), mode, 0644);
    if (fd == -1) [[unlikely]] {
        throw_errno("::open");
    }
    struct ::stat st = {};
    if (::fstat(fd, &st) == -1) [[unlikely]] {
        auto const error = errno;
        ::close(fd);
        errno = error;
        throw_errno("::fstat");
    }
#ifdef POSIX_FADV_SEQUENTIAL
    if (flags & SEQUENTIAL) {
        (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
    } else if (flags & RANDOM_ACCESS) {
        (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_RANDOM);
    }
#endif
    fd_ = fd;
    size_ = (std::size_t)st.st_size;
    flags_ = flags;
}

IO::File::~File() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

auto IO::File::truncate(std::size_t size) noexcept -> bool {
    if (fd_ == -1 || !(flags_ & WRITE)) {
        return false;
    }
    if (size_ != size && ::ftruncate(fd_, (off_t)size) == -1) [[unlikely]] {
        return false;
    }
    size_ = size;
    return true;
}

auto IO::File::read(std::size_t offset, std::span<char> dst) const noexcept -> bool {
    if (fd_ == -1) {
        return false;
    }
    while (!dst.empty()) {
        auto const got = ::pread(fd_, dst.data(), dst.size(), (off_t)offset);
        if (got == -1 && errno == EINTR) {
            continue;
        }
        // 0 means the file ended before dst was filled
        if (got <= 0) {
            return false;
        }
        dst = dst.subspan((std::size_t)got);
        offset += (std::size_t)got;
    }
    return true;
}

auto IO::File::write(std::size_t offset, std::span<char const> src) noexcept -> bool {
    if (fd_ == -1 || !(flags_ & WRITE)) {
        return false;
    }
    auto const end = offset + src.size();
    if (end < offset) {
        return false;
    }
    while (!src.empty()) {
        auto const got = ::pwrite(fd_, src.data(), src.size(), (off_t)offset);
        if (got == -1 && errno == EINTR) {
            continue;
        }
        if (got <= 0) {
            return false;
        }
        src = src.subspan((std::size_t)got);
        offset += (std::size_t)got;
    }
    size_ = std::max(size_, end);
    return true;
}

// Returned span stays valid until the next copy on the same thread.
auto IO::File::copy(std::size_t offset, std::size_t count) const -> std::span<char const> {
    thread_local auto scratch = std::vector<char>();
    if (scratch.size() < count) {
        scratch.clear();
        scratch.resize(count);
    }
    xblib_assert_io(this->read(offset, {scratch.data(), count}));
    return {scratch.data(), count};
}
