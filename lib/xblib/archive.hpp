#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "arh.hpp"
#include "buffer.hpp"
#include "common.hpp"
#include "filetype.hpp"
#include "iofile.hpp"
#include "xbc1.hpp"

namespace xblib {
    struct Archive {
        struct ExtractOptions {
            fs::path ard;
            fs::path arh;
            fs::path output;
            std::uint32_t parallel = 0;
            bool verify = true;
            bool dry_run = false;
        };

        struct BuildOptions {
            std::vector<fs::path> inputs;
            fs::path root;
            fs::path ard;
            fs::path arh;
            bool compress = false;
            // nullopt picks zstd above 1MiB and zlib otherwise
            std::optional<XBC1::Kind> kind = XBC1::Kind::Zstd;
            int level = 0;
            std::uint32_t alignment = ARH::DEFAULT_ALIGNMENT;
            bool names = true;
            bool raw_fallback = false;
            std::uint32_t parallel = 0;
        };

        struct Failure {
            std::uint32_t index;
            std::string error;
        };

        struct Report {
            std::size_t total = {};
            std::size_t succeeded = {};
            std::uint64_t bytes = {};
            std::vector<Failure> failures = {};

            explicit operator bool() const noexcept { return failures.empty(); }
        };

        using progress_cb = function_ref<void(ARH::Entry const& entry)>;
        using classify_cb = function_ref<FileType(std::span<char const> data)>;

        // Entries are processed independently, a failed entry is reported and does not stop the others.
        static auto extract(ExtractOptions const& options, ARH::filter_cb filter = {}, progress_cb progress = {})
            -> Report;

        // Reads and, for XBC1 storage, decodes one entry.
        static auto extract_entry(IO const& ard, ARH::Entry const& entry, bool verify = true) -> Buffer;

        static auto output_path(fs::path const& output, ARH::Entry const& entry) -> fs::path;

        // All or nothing: on failure the ARD is removed, no ARH is published and the error is rethrown.
        static auto build(BuildOptions const& options, classify_cb classify = {}, progress_cb progress = {}) -> ARH;

        static auto cache_id(std::string_view relative) noexcept -> std::uint64_t;

    private:
        struct Input;
        struct Prepared;

        static auto prepare(BuildOptions const& options, Input const& input, std::uint32_t index, classify_cb classify)
            -> Prepared;
    };
}
