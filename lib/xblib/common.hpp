#pragma once
#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#define xblib_concat_impl(x, y) x##y
#define xblib_concat(x, y) xblib_concat_impl(x, y)

#define xblib_error(errc, msg) ::xblib::throw_error(errc, __PRETTY_FUNCTION__, msg)

#define xblib_assert_errc(errc, ...)                                        \
    do {                                                                    \
        if (!(__VA_ARGS__)) [[unlikely]] {                                  \
            ::xblib::throw_error(errc, __PRETTY_FUNCTION__, #__VA_ARGS__); \
        }                                                                   \
    } while (false)

#define xblib_assert(...) xblib_assert_errc(::xblib::Errc::Format, __VA_ARGS__)

#define xblib_assert_io(...) xblib_assert_errc(::xblib::Errc::IO, __VA_ARGS__)

#define xblib_rethrow(...)                                                   \
    [&, func = __PRETTY_FUNCTION__]() -> decltype(auto) {                    \
        try {                                                                \
            return __VA_ARGS__;                                              \
        } catch (std::filesystem::filesystem_error const& e) {               \
            ::xblib::throw_error(::xblib::Errc::IO, func, e.what());         \
        }                                                                    \
    }()

// Pushes a fmt formatted line onto the thread's trace when the scope unwinds by exception.
#define xblib_trace(...)                                                        \
    ::xblib::ErrorTrace xblib_concat(xblib_trace_, __LINE__) {                  \
        [&] { ::xblib::error_stack().push_back(::fmt::format(__VA_ARGS__)); }   \
    }

#define xblib_assert_zstd(...)                                                        \
    [&, func = __PRETTY_FUNCTION__]() -> std::size_t {                                \
        if (std::size_t result = __VA_ARGS__; ZSTD_isError(result)) [[unlikely]] {    \
            ::xblib::throw_error(::xblib::Errc::Compression, func, ZSTD_getErrorName(result)); \
        } else {                                                                      \
            return result;                                                            \
        }                                                                             \
    }()

#define xblib_assert_mz(...)                                                             \
    do {                                                                                 \
        if (auto result = __VA_ARGS__; result != MZ_OK) [[unlikely]] {                  \
            ::xblib::throw_error(::xblib::Errc::Compression, __PRETTY_FUNCTION__, mz_error(result)); \
        }                                                                                \
    } while (false)

namespace xblib {
    inline constexpr std::size_t MiB = std::size_t{1} << 20;

    namespace fs = std::filesystem;
    using namespace std::literals::string_view_literals;

    enum class Errc : std::uint8_t {
        Format,
        Integrity,
        IO,
        Compression,
    };

    extern auto errc_name(Errc errc) noexcept -> char const*;

    struct Error : std::runtime_error {
        Error(Errc errc, std::string const& what) : std::runtime_error(what), errc_(errc) {}

        auto errc() const noexcept -> Errc { return errc_; }

    private:
        Errc errc_;
    };

    [[noreturn]] extern void throw_error(Errc errc, std::string_view from, char const* msg);

    [[noreturn]] inline void throw_error(Errc errc, std::string_view from, std::error_code const& ec) {
        throw_error(errc, from, ec.message().c_str());
    }

    using error_stack_t = std::vector<std::string>;

    // Context lines collected while an exception unwinds, innermost first.
    extern auto error_stack() noexcept -> error_stack_t&;

    template <typename Push>
    struct ErrorTrace {
        ErrorTrace(Push&& push) noexcept : push_(std::move(push)), exceptions_(std::uncaught_exceptions()) {}
        ~ErrorTrace() noexcept {
            if (std::uncaught_exceptions() > exceptions_) {
                push_();
            }
        }

    private:
        Push push_;
        int exceptions_;
    };

    // Message of e followed by the calling thread's trace stack, which is cleared.
    extern auto error_message(std::exception const& e) -> std::string;

    extern auto print_error(std::exception const& e) noexcept -> void;

    // Single line "BANNER: done/total pct%" on stderr, redrawn when the percentage changes.
    struct Progress {
        Progress(char const* banner, std::uint64_t total, bool enabled = true) noexcept;
        Progress(Progress const&) = delete;
        ~Progress() noexcept;

        auto tick() noexcept -> void;

    private:
        auto draw() const noexcept -> void;

        char const* banner_;
        std::uint64_t total_;
        std::uint64_t done_ = {};
        std::uint64_t shown_ = {};
        bool enabled_;
    };

    extern auto from_hex(std::string_view name) noexcept -> std::optional<std::uint64_t>;

    inline auto in_range(std::size_t offset, std::size_t size, std::size_t target) noexcept -> bool {
        return offset <= target && target - offset >= size;
    }

    inline auto align_up(std::uint64_t value, std::uint64_t alignment) noexcept -> std::uint64_t {
        return (value + alignment - 1) & ~(alignment - 1);
    }

    template <typename Signature>
    struct function_ref;

    template <typename Ret, typename... Args>
    struct function_ref<Ret(Args...)> {
        constexpr function_ref() noexcept = default;

        template <typename Func>
            requires(std::is_invocable_r_v<Ret, Func, Args...>)
        function_ref(Func* func) noexcept
            : invoke_(+[](void* ref, Args... args) -> Ret {
                  return std::invoke(*(Func*)ref, std::forward<Args>(args)...);
              }),
              ref_((void*)func) {}

        template <typename Func>
            requires(std::is_invocable_r_v<Ret, Func, Args...> && !std::is_same_v<std::decay_t<Func>, function_ref>)
        function_ref(Func&& func) noexcept : function_ref(&func) {}

        explicit constexpr operator bool() const noexcept { return ref_; }

        constexpr bool operator!() const noexcept { return !ref_; }

        auto operator()(Args... args) const -> Ret { return invoke_(ref_, std::forward<Args>(args)...); }

    private:
        Ret (*invoke_)(void* ref, Args...) = nullptr;
        void* ref_ = nullptr;
    };

    // input itself when it is a file, otherwise every regular file below it.
    extern auto collect_files(fs::path const& input) -> std::vector<fs::path>;

    extern auto fs_relative(fs::path const& target, fs::path const& parent) -> std::string;
}
