#include <gtest/gtest.h>

#include <xblib/ard.hpp>
#include <xblib/iofile.hpp>

#include "test_helpers.hpp"

using namespace xblib;
using namespace xblib::test;

class ARDTest : public TempDirTest {};

TEST_F(ARDTest, AppendPadsToAlignment) {
    auto const path = dir_ / "data.ard";
    {
        auto writer = ARD::Writer(path, 16);
        auto const first = writer.append(std::string("hello"));
        EXPECT_EQ(first.offset, 0u);
        EXPECT_EQ(first.cursor, 16u);

        auto const second = writer.append(std::string(16, 'x'));
        EXPECT_EQ(second.offset, 16u);
        EXPECT_EQ(second.cursor, 32u);

        auto const empty = writer.append({});
        EXPECT_EQ(empty.offset, 32u);
        EXPECT_EQ(empty.cursor, 32u);

        auto const third = writer.append(std::string("!"));
        EXPECT_EQ(third.offset, 32u);
        EXPECT_EQ(writer.cursor(), 48u);
    }
    auto const content = read_file(path);
    ASSERT_EQ(content.size(), 48u);
    EXPECT_EQ(content.substr(0, 5), "hello");
    EXPECT_EQ(content.substr(5, 11), std::string(11, '\0'));
    EXPECT_EQ(content.substr(16, 16), std::string(16, 'x'));
    EXPECT_EQ(content.substr(32, 1), "!");
    EXPECT_EQ(content.substr(33), std::string(15, '\0'));
}

TEST_F(ARDTest, LargeAlignmentPadding) {
    auto const path = dir_ / "data.ard";
    {
        auto writer = ARD::Writer(path, 4096);
        EXPECT_EQ(writer.append(std::string(1, 'a')).cursor, 4096u);
        EXPECT_EQ(writer.append(std::string(4097, 'b')).offset, 4096u);
        EXPECT_EQ(writer.cursor(), 3 * 4096u);
    }
    EXPECT_EQ(fs::file_size(path), 3 * 4096u);
}

TEST_F(ARDTest, AlignmentOfOneIsContiguous) {
    auto const path = dir_ / "data.ard";
    {
        auto writer = ARD::Writer(path, 1);
        EXPECT_EQ(writer.append(std::string("abc")).offset, 0u);
        EXPECT_EQ(writer.append(std::string("de")).offset, 3u);
    }
    EXPECT_EQ(read_file(path), "abcde");
}

TEST_F(ARDTest, RejectsNonPowerOfTwoAlignment) {
    EXPECT_EQ(errc_of([&] { ARD::Writer(dir_ / "data.ard", 12); }), Errc::Format);
    EXPECT_EQ(errc_of([&] { ARD::Writer(dir_ / "data.ard", 0); }), Errc::Format);
}

TEST_F(ARDTest, WriterTruncatesExistingFile) {
    auto const path = write_file("data.ard", std::string(1000, 'z'));
    {
        auto writer = ARD::Writer(path, 16);
        (void)writer.append(std::string("new"));
    }
    EXPECT_EQ(fs::file_size(path), 16u);
}

TEST_F(ARDTest, ReadRange) {
    auto const path = write_file("data.ard", "0123456789");
    auto const file = IO::File(path, IO::READ | IO::RANDOM_ACCESS);
    EXPECT_EQ(to_string(ARD::read_range(file, 2, 5)), "23456");
    EXPECT_EQ(to_string(ARD::read_range(file, 10, 0)), "");
    EXPECT_EQ(to_string(ARD::read_range(file, 0, 10)), "0123456789");
}

TEST_F(ARDTest, ShortReadIsIOError) {
    auto const path = write_file("data.ard", "0123456789");
    auto const file = IO::File(path, IO::READ | IO::RANDOM_ACCESS);
    EXPECT_EQ(errc_of([&] { (void)ARD::read_range(file, 8, 3); }), Errc::IO);
    EXPECT_EQ(errc_of([&] { (void)ARD::read_range(file, 11, 0); }), Errc::IO);
    EXPECT_EQ(errc_of([&] { (void)ARD::read_range(file, ~std::uint64_t{0}, 2); }), Errc::IO);
}

TEST_F(ARDTest, MissingFileIsIOError) {
    EXPECT_EQ(errc_of([&] { IO::File(dir_ / "missing.ard", IO::READ); }), Errc::IO);
}
