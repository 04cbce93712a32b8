#include "common.hpp"

#include <charconv>
#include <cstdio>
#include <utility>

using namespace xblib;

auto xblib::errc_name(Errc errc) noexcept -> char const* {
    switch (errc) {
        case Errc::Format:
            return "FormatError";
        case Errc::Integrity:
            return "IntegrityError";
        case Errc::IO:
            return "IOError";
        case Errc::Compression:
            return "CompressionError";
    }
    return "Error";
}

void xblib::throw_error(Errc errc, std::string_view from, char const* msg) {
    throw Error(errc, fmt::format("{}: {}: {}", errc_name(errc), from, msg));
}

auto xblib::error_stack() noexcept -> error_stack_t& {
    thread_local auto stack = error_stack_t{};
    return stack;
}

auto xblib::error_message(std::exception const& e) -> std::string {
    auto result = std::string(e.what());
    for (auto& line : std::exchange(error_stack(), {})) {
        result += "\n\t";
        result += line;
    }
    return result;
}

auto xblib::print_error(std::exception const& e) noexcept -> void {
    auto& stack = error_stack();
    fmt::print(stderr, "{}\n", e.what());
    for (auto const& line : stack) {
        fmt::print(stderr, "\t{}\n", line);
    }
    stack.clear();
}

xblib::Progress::Progress(char const* banner, std::uint64_t total, bool enabled) noexcept
    : banner_(banner), total_(total), enabled_(enabled) {
    draw();
}

xblib::Progress::~Progress() noexcept {
    if (enabled_) {
        draw();
        fmt::print(stderr, "\n");
    }
}

auto xblib::Progress::tick() noexcept -> void {
    ++done_;
    auto const percent = total_ ? done_ * 100 / total_ : 100;
    if (percent != shown_) {
        shown_ = percent;
        draw();
    }
}

auto xblib::Progress::draw() const noexcept -> void {
    if (enabled_) {
        fmt::print(stderr, "\r{}: {}/{} {}%", banner_, done_, total_, shown_);
        std::fflush(stderr);
    }
}

auto xblib::from_hex(std::string_view name) noexcept -> std::optional<std::uint64_t> {
    auto value = std::uint64_t{};
    auto const end = name.data() + name.size();
    if (name.empty() || name.size() > 16) {
        return std::nullopt;
    }
    if (auto const [ptr, ec] = std::from_chars(name.data(), end, value, 16); ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto xblib::collect_files(fs::path const& input) -> std::vector<fs::path> {
    xblib_trace("input: {}", input.generic_string());
    xblib_assert_io(fs::exists(input));
    if (!fs::is_directory(input)) {
        return {input};
    }
    auto result = std::vector<fs::path>{};
    for (auto const& entry : xblib_rethrow(fs::recursive_directory_iterator(input))) {
        if (entry.is_regular_file()) {
            result.push_back(entry.path());
        }
    }
    return result;
}

auto xblib::fs_relative(fs::path const& target, fs::path const& parent) -> std::string {
    auto result = fs::relative(target, parent).generic_string();
    if (result.empty() || result == ".") {
        result = target.filename().generic_string();
    }
    return result;
}
