#include <fmt/args.h>

#include <argparse/argparse.hpp>
#include <iostream>
#include <xblib/arh.hpp>
#include <xblib/common.hpp>
#include <xblib/iofile.hpp>

using namespace xblib;

struct Main {
    struct CLI {
        std::string input = {};
        std::string format = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Lists entries of an archive header.");

        program.add_argument("--format")
            .help("Format output.")
            .default_value(std::string("{index},{id:016x},{offset},{storedSize},{uncompressedSize},{storage},{type},{name}"));

        program.add_argument("input").help("Archive header file to read from.").required();

        program.parse_args(argc, argv);

        cli.input = program.get<std::string>("input");
        cli.format = program.get<std::string>("--format");
    }

    auto run() -> void {
        xblib_trace("path: {}", cli.input);
        auto infile = IO::File(cli.input, IO::READ);
        auto const arh = ARH::read(infile);
        for (auto const& entry : arh.entries) {
            fmt::dynamic_format_arg_store<fmt::format_context> store{};
            store.push_back(fmt::arg("index", entry.index));
            store.push_back(fmt::arg("id", entry.id));
            store.push_back(fmt::arg("offset", entry.offset));
            store.push_back(fmt::arg("storedSize", entry.stored_size));
            store.push_back(fmt::arg("uncompressedSize", entry.uncompressed_size));
            store.push_back(fmt::arg("storage", ARH::storage_name(entry.storage)));
            store.push_back(fmt::arg("type", filetype_name(entry.type)));
            store.push_back(fmt::arg("name", entry.name));
            std::cout << fmt::vformat(cli.format, store) << std::endl;
        }
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
