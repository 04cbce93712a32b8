#include <argparse/argparse.hpp>
#include <iostream>
#include <xblib/archive.hpp>
#include <xblib/common.hpp>

using namespace xblib;

struct Main {
    struct CLI {
        std::string ard = {};
        std::string arh = {};
        bool no_hash = {};
        bool no_progress = {};
        std::uint32_t parallel = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Checks every entry of an ARD/ARH archive pair for errors.");
        program.add_argument("ard").help("Archive data file to read from.").required();
        program.add_argument("arh").help("Archive header file to read from.").required();

        program.add_argument("--no-hash").help("Do not verify checksum.").default_value(false).implicit_value(true);
        program.add_argument("--no-progress")
            .help("Do not print progress to cerr.")
            .default_value(false)
            .implicit_value(true);
        program.add_argument("--parallel")
            .help("Number of threads to use.")
            .default_value(std::uint32_t{0})
            .action([](std::string const& value) -> std::uint32_t { return (std::uint32_t)std::stoul(value); });
        program.parse_args(argc, argv);

        cli.no_hash = program.get<bool>("--no-hash");
        cli.no_progress = program.get<bool>("--no-progress");
        cli.parallel = program.get<std::uint32_t>("--parallel");

        cli.ard = program.get<std::string>("ard");
        cli.arh = program.get<std::string>("arh");
    }

    auto run() -> int {
        auto const options = Archive::ExtractOptions{
            .ard = cli.ard,
            .arh = cli.arh,
            .output = {},
            .parallel = cli.parallel,
            .verify = !cli.no_hash,
            .dry_run = true,
        };
        auto total = std::size_t{};
        {
            auto file = IO::File(options.arh, IO::READ);
            total = ARH::read(file).entries.size();
        }

        std::cerr << "Checking " << total << " entries ... " << std::endl;
        auto report = Archive::Report{};
        {
            auto progress = Progress("CHECKED", total, !cli.no_progress);
            report = Archive::extract(options, {}, [&](ARH::Entry const&) { progress.tick(); });
        }
        for (auto const& failure : report.failures) {
            std::cout << "FAIL #" << failure.index << std::endl;
            std::cerr << failure.error << std::endl;
        }
        std::cout << (report ? "OK!" : "FAIL!") << std::endl;
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
