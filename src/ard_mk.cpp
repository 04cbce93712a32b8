#include <argparse/argparse.hpp>
#include <iostream>
#include <optional>
#include <xblib/archive.hpp>
#include <xblib/common.hpp>
#include <xblib/filetype.hpp>

using namespace xblib;

struct Main {
    struct CLI {
        std::string input = {};
        std::string ard = {};
        std::string arh = {};
        bool compress = {};
        std::optional<XBC1::Kind> kind = XBC1::Kind::Zstd;
        int level = {};
        std::uint32_t alignment = ARH::DEFAULT_ALIGNMENT;
        bool no_names = {};
        bool raw_fallback = {};
        std::uint32_t parallel = {};
        bool no_progress = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Packs a file or folder into an ARD/ARH archive pair.");
        program.add_argument("input").help("File or folder to read from.").required();
        program.add_argument("ard").help("Archive data file to write into.").required();
        program.add_argument("arh").help("Archive header file to write into.").required();

        program.add_argument("--compress-files")
            .help("Wrap every file in an xbc1 container.")
            .default_value(false)
            .implicit_value(true);
        program.add_argument("--kind")
            .help("Compression kind: zlib, zstd or auto.")
            .default_value(std::optional<XBC1::Kind>{XBC1::Kind::Zstd})
            .action([](std::string const& value) -> std::optional<XBC1::Kind> {
                if (value == "auto") {
                    return std::nullopt;
                }
                auto const kind = XBC1::parse_kind(value);
                if (kind == XBC1::Kind::None) {
                    throw std::runtime_error("Kind must be zlib, zstd or auto!");
                }
                return kind;
            });
        program.add_argument("--level")
            .help("Compression level, 0 selects the maximum for the kind.")
            .default_value(int{0})
            .action([](std::string const& value) -> int { return std::stoi(value); });
        program.add_argument("--alignment")
            .help("Alignment of every entry inside the archive data file.")
            .default_value(std::uint32_t{ARH::DEFAULT_ALIGNMENT})
            .action([](std::string const& value) -> std::uint32_t {
                auto const result = (std::uint32_t)std::stoul(value);
                if (result == 0 || (result & (result - 1)) != 0) {
                    throw std::runtime_error("Alignment must be a power of two!");
                }
                return result;
            });
        program.add_argument("--no-names")
            .help("Do not store file names, entries are extracted by id.")
            .default_value(false)
            .implicit_value(true);
        program.add_argument("--raw-fallback")
            .help("Store entries raw when compression does not shrink them.")
            .default_value(false)
            .implicit_value(true);
        program.add_argument("--parallel")
            .help("Number of worker threads, 0 selects host concurrency.")
            .default_value(std::uint32_t{0})
            .action([](std::string const& value) -> std::uint32_t { return (std::uint32_t)std::stoul(value); });
        program.add_argument("--no-progress")
            .help("Do not print progress to cerr.")
            .default_value(false)
            .implicit_value(true);

        program.parse_args(argc, argv);

        cli.compress = program.get<bool>("--compress-files");
        cli.kind = program.get<std::optional<XBC1::Kind>>("--kind");
        cli.level = program.get<int>("--level");
        cli.alignment = program.get<std::uint32_t>("--alignment");
        cli.no_names = program.get<bool>("--no-names");
        cli.raw_fallback = program.get<bool>("--raw-fallback");
        cli.parallel = program.get<std::uint32_t>("--parallel");
        cli.no_progress = program.get<bool>("--no-progress");

        cli.input = program.get<std::string>("input");
        cli.ard = program.get<std::string>("ard");
        cli.arh = program.get<std::string>("arh");
    }

    auto run() -> void {
        std::cerr << "Collecting input files ... " << std::endl;
        auto const root = fs::is_directory(cli.input) ? fs::path(cli.input) : fs::path{};
        auto inputs = collect_files(cli.input);

        std::cerr << "Packing " << inputs.size() << " files ... " << std::endl;
        auto const options = Archive::BuildOptions{
            .inputs = std::move(inputs),
            .root = root,
            .ard = cli.ard,
            .arh = cli.arh,
            .compress = cli.compress,
            .kind = cli.kind,
            .level = cli.level,
            .alignment = cli.alignment,
            .names = !cli.no_names,
            .raw_fallback = cli.raw_fallback,
            .parallel = cli.parallel,
        };
        auto arh = ARH{};
        {
            auto progress = Progress("PACKED", options.inputs.size(), !cli.no_progress);
            arh = Archive::build(
                options,
                [](std::span<char const> data) { return classify(data); },
                [&](ARH::Entry const&) { progress.tick(); });
        }
        auto stored = std::uint64_t{};
        auto compressed = std::size_t{};
        for (auto const& entry : arh.entries) {
            stored += entry.stored_size;
            compressed += entry.storage == ARH::Storage::XBC1;
        }
        fmt::print("Packed {} entries ({} compressed), {} bytes stored.\n", arh.entries.size(), compressed, stored);
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
