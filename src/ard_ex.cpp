#include <argparse/argparse.hpp>
#include <iostream>
#include <optional>
#include <regex>
#include <xblib/archive.hpp>
#include <xblib/common.hpp>

using namespace xblib;

struct Main {
    struct CLI {
        std::string ard = {};
        std::string arh = {};
        std::string output = {};
        bool only_bdat = {};
        std::optional<std::regex> filter = {};
        std::uint32_t parallel = {};
        bool no_hash = {};
        bool no_progress = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Extracts entries from an ARD/ARH archive pair.");
        program.add_argument("ard").help("Archive data file to read from.").required();
        program.add_argument("arh").help("Archive header file to read from.").required();
        program.add_argument("output")
            .help("Directory to write entries into, defaults to <ard>_extracted.")
            .default_value(std::string{});

        program.add_argument("--only-bdat")
            .help("Extract only entries tagged as BDAT.")
            .default_value(false)
            .implicit_value(true);
        program.add_argument("--filter")
            .help("Extract only entries whose name or id matches regex.")
            .default_value(std::optional<std::regex>{})
            .action([](std::string const& value) -> std::optional<std::regex> {
                if (value.empty()) {
                    return std::nullopt;
                } else {
                    return std::regex{value, std::regex::optimize | std::regex::icase};
                }
            });
        program.add_argument("--parallel")
            .help("Number of worker threads, 0 selects host concurrency.")
            .default_value(std::uint32_t{0})
            .action([](std::string const& value) -> std::uint32_t { return (std::uint32_t)std::stoul(value); });
        program.add_argument("--no-hash").help("Do not verify checksum.").default_value(false).implicit_value(true);
        program.add_argument("--no-progress")
            .help("Do not print progress to cerr.")
            .default_value(false)
            .implicit_value(true);

        program.parse_args(argc, argv);

        cli.only_bdat = program.get<bool>("--only-bdat");
        cli.filter = program.get<std::optional<std::regex>>("--filter");
        cli.parallel = program.get<std::uint32_t>("--parallel");
        cli.no_hash = program.get<bool>("--no-hash");
        cli.no_progress = program.get<bool>("--no-progress");

        cli.ard = program.get<std::string>("ard");
        cli.arh = program.get<std::string>("arh");
        cli.output = program.get<std::string>("output");
        if (cli.output.empty()) {
            auto const ard = fs::path(cli.ard);
            cli.output = (ard.parent_path() / (ard.stem().generic_string() + "_extracted")).generic_string();
        }
    }

    auto match(ARH::Entry const& entry) const -> bool {
        if (cli.only_bdat && entry.type != FileType::BDAT) {
            return false;
        }
        if (cli.filter) {
            auto const key = entry.name.empty() ? fmt::format("{:016x}", entry.id) : entry.name;
            if (!std::regex_search(key, *cli.filter)) {
                return false;
            }
        }
        return true;
    }

    auto run() -> int {
        auto const options = Archive::ExtractOptions{
            .ard = cli.ard,
            .arh = cli.arh,
            .output = cli.output,
            .parallel = cli.parallel,
            .verify = !cli.no_hash,
            .dry_run = false,
        };
        auto selected = std::size_t{};
        auto const arh = [&] {
            auto file = IO::File(options.arh, IO::READ);
            return ARH::read(file);
        }();
        for (auto const& entry : arh.entries) {
            selected += entry.storage == ARH::Storage::Detect || match(entry);
        }

        std::cerr << "Extracting " << selected << " entries into " << cli.output << " ... " << std::endl;
        auto report = Archive::Report{};
        {
            auto progress = Progress("EXTRACTED", selected, !cli.no_progress);
            report = Archive::extract(
                options,
                [this](ARH::Entry const& entry) { return match(entry); },
                [&](ARH::Entry const&) { progress.tick(); });
        }
        for (auto const& failure : report.failures) {
            fmt::print(stderr, "FAIL #{}: {}\n", failure.index, failure.error);
        }
        fmt::print("Extracted {}/{} entries, {} bytes.\n", report.succeeded, report.total, report.bytes);
        return report ? EXIT_SUCCESS : EXIT_FAILURE;
    }
};

int main(int argc, char** argv) {
    auto main = Main{};
    try {
        main.parse_args(argc, argv);
        return main.run();
    } catch (std::exception const& e) {
        print_error(e);
        return EXIT_FAILURE;
    }
}
