#pragma once
#include <gtest/gtest.h>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <xblib/common.hpp>

namespace xblib::test {
    // Errc of the xblib::Error thrown by func, nullopt when nothing was thrown.
    template <typename Func>
    inline auto errc_of(Func&& func) -> std::optional<Errc> {
        try {
            func();
        } catch (Error const& e) {
            error_stack().clear();
            return e.errc();
        }
        return std::nullopt;
    }

    inline auto pattern(std::size_t size, std::uint32_t seed = 0) -> std::string {
        auto result = std::string(size, '\0');
        for (std::size_t i = 0; i != size; ++i) {
            result[i] = (char)((i * 31 + seed + i / 251) & 0xFF);
        }
        return result;
    }

    inline auto noise(std::size_t size, std::uint32_t seed = 1) -> std::string {
        auto engine = std::mt19937(seed);
        auto dist = std::uniform_int_distribution<int>(0, 255);
        auto result = std::string(size, '\0');
        for (auto& c : result) {
            c = (char)dist(engine);
        }
        return result;
    }

    inline auto to_string(std::span<char const> data) -> std::string { return {data.data(), data.size()}; }

    class TempDirTest : public ::testing::Test {
    protected:
        void SetUp() override {
            auto const info = ::testing::UnitTest::GetInstance()->current_test_info();
            dir_ = fs::temp_directory_path() / fmt::format("xblib_{}_{}", info->test_suite_name(), info->name());
            fs::remove_all(dir_);
            fs::create_directories(dir_);
        }

        void TearDown() override { fs::remove_all(dir_); }

        auto write_file(fs::path const& relative, std::string const& content) -> fs::path {
            auto const path = dir_ / relative;
            fs::create_directories(path.parent_path());
            auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
            file.write(content.data(), (std::streamsize)content.size());
            return path;
        }

        auto read_file(fs::path const& path) -> std::string {
            auto file = std::ifstream(path, std::ios::binary);
            return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
        }

        fs::path dir_;
    };
}
