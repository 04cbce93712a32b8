#include <argparse/argparse.hpp>
#include <iostream>
#include <xblib/common.hpp>
#include <xblib/iofile.hpp>
#include <xblib/xbc1.hpp>

using namespace xblib;

struct Main {
    struct CLI {
        std::string input = {};
        std::string output = {};
        bool compress = {};
        XBC1::Kind kind = XBC1::Kind::Zlib;
        int level = {};
        std::string name = {};
        bool no_hash = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Decompresses or compresses a single xbc1 file.");
        program.add_argument("input").help("File to read from.").required();
        program.add_argument("output").help("File to write into.").default_value(std::string{});

        program.add_argument("-c", "--compress")
            .help("Compress input into xbc1 instead of decompressing it.")
            .default_value(false)
            .implicit_value(true);
        program.add_argument("-t", "--type")
            .help("Compression type: 1 (zlib, default) or 3 (zstd).")
            .default_value(XBC1::Kind::Zlib)
            .action([](std::string const& value) -> XBC1::Kind {
                auto const kind = XBC1::parse_kind(value);
                if (kind == XBC1::Kind::None) {
                    throw std::runtime_error("Type must be 1 or 3!");
                }
                return kind;
            });
        program.add_argument("-l", "--level")
            .help("Compression level, 0 selects the maximum for the type.")
            .default_value(std::int32_t{0})
            .action([](std::string const& value) -> std::int32_t { return std::stoi(value); });
        program.add_argument("-n", "--name")
            .help("Name stored in the header, defaults to the input file name.")
            .default_value(std::string{});
        program.add_argument("--no-hash").help("Do not verify checksum.").default_value(false).implicit_value(true);

        program.parse_args(argc, argv);

        cli.compress = program.get<bool>("--compress");
        cli.kind = program.get<XBC1::Kind>("--type");
        cli.level = program.get<std::int32_t>("--level");
        cli.name = program.get<std::string>("--name");
        cli.no_hash = program.get<bool>("--no-hash");

        cli.input = program.get<std::string>("input");
        cli.output = program.get<std::string>("output");
        if (cli.output.empty()) {
            cli.output = fs::path(cli.input).replace_extension(cli.compress ? ".xbc1" : ".dec").generic_string();
        }
        if (cli.name.empty()) {
            cli.name = fs::path(cli.input).filename().generic_string();
        }
    }

    auto run() -> void {
        xblib_trace("input: {}", cli.input);
        auto infile = IO::File(cli.input, IO::READ | IO::SEQUENTIAL);
        auto const src = infile.copy(0, infile.size());
        auto dst = Buffer{};
        if (cli.compress) {
            dst = XBC1::encode(src, cli.kind, cli.level, cli.name);
        } else {
            auto const header = XBC1::read_header(src);
            fmt::print(stderr, "{}: {} {} -> {}\n", header.name_view(), header.kind, header.compressed_size,
                       header.uncompressed_size);
            dst = XBC1::decode(src, !cli.no_hash);
        }
        xblib_trace("output: {}", cli.output);
        auto outfile = IO::File(cli.output, IO::WRITE);
        xblib_assert_io(outfile.truncate(0));
        xblib_assert_io(outfile.write(0, dst));
        fmt::print("{} -> {}\n", cli.input, cli.output);
    }
};

int main(int argc, char** argv) {
    auto main = Main{};
    try {
        main.parse_args(argc, argv);
        main.run();
    } catch (std::exception const& e) {
        print_error(e);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
