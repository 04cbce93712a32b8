#include "archive.hpp"

#include <xxhash.h>

#include <bit>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>

#include "ard.hpp"
#include "workers.hpp"

using namespace xblib;

struct Archive::Input {
    fs::path path;
    std::string relative;
};

struct Archive::Prepared {
    Buffer data;
    ARH::Entry entry;
};

auto Archive::cache_id(std::string_view relative) noexcept -> std::uint64_t {
    auto const name = fs::path(relative).filename().string();
    if (auto id = from_hex(std::string_view(name).substr(0, name.find('.')))) {
        return *id;
    }
    return XXH64(relative.data(), relative.size(), 0);
}

auto Archive::output_path(fs::path const& output, ARH::Entry const& entry) -> fs::path {
    if (entry.name.empty()) {
        return output / fmt::format("{:016x}{}", entry.id, filetype_extension(entry.type));
    }
    xblib_trace("name: {}", entry.name);
    auto const relative = fs::path(entry.name).lexically_normal();
    xblib_assert(relative.is_relative() && !relative.has_root_name() && !relative.has_root_directory());
    xblib_assert(!relative.empty() && *relative.begin() != "..");
    xblib_assert(relative.has_filename() && relative.filename() != "." && relative.filename() != "..");
    return output / relative;
}

auto Archive::extract_entry(IO const& ard, ARH::Entry const& entry, bool verify) -> Buffer {
    xblib_trace("entry: {}", entry.index);
    auto const src = ARD::read_range(ard, entry.offset, entry.stored_size);
    auto result = Buffer{};
    switch (entry.storage) {
        case ARH::Storage::Raw:
            xblib_assert_errc(Errc::Integrity, entry.stored_size == entry.uncompressed_size);
            xblib_assert_io(result.append(src));
            break;
        case ARH::Storage::XBC1:
            result = XBC1::decode(src, verify);
            break;
        case ARH::Storage::Detect:
            // Legacy records carry no usable uncompressed size.
            if (XBC1::check_magic(src)) {
                return XBC1::decode(src, verify);
            }
            xblib_assert_io(result.append(src));
            return result;
        default:
            xblib_error(Errc::Format, "Unknown storage!");
    }
    xblib_assert_errc(Errc::Integrity, result.size() == entry.uncompressed_size);
    return result;
}

// Key of the file an entry extracts to, without validating it. Detect entries only learn their
// type when decoded so they are keyed by id alone.
static auto output_key(ARH::Entry const& entry) -> std::string {
    if (!entry.name.empty()) {
        return fs::path(entry.name).lexically_normal().generic_string();
    }
    if (entry.storage == ARH::Storage::Detect) {
        return fmt::format("{:016x}", entry.id);
    }
    return fmt::format("{:016x}{}", entry.id, filetype_extension(entry.type));
}

auto Archive::extract(ExtractOptions const& options, ARH::filter_cb filter, progress_cb progress) -> Report {
    xblib_trace("arh: {}", options.arh.generic_string());
    auto const arh = [&] {
        auto file = IO::File(options.arh, IO::READ);
        return ARH::read(file);
    }();
    auto const entries = arh.filter([&](ARH::Entry const& entry) {
        return entry.storage == ARH::Storage::Detect || !filter || filter(entry);
    });

    // Later entries that would overwrite an earlier entry's output fail instead.
    auto owners = std::vector<std::optional<std::uint32_t>>(entries.size());
    if (!options.dry_run) {
        auto seen = std::unordered_map<std::string, std::uint32_t>{};
        for (std::size_t i = 0; i != entries.size(); ++i) {
            auto const [it, inserted] = seen.emplace(output_key(entries[i]), entries[i].index);
            if (!inserted) {
                owners[i] = it->second;
            }
        }
    }

    xblib_trace("ard: {}", options.ard.generic_string());
    auto const ard = IO::File(options.ard, IO::READ | IO::RANDOM_ACCESS);
    if (!options.dry_run) {
        xblib_rethrow(fs::create_directories(options.output));
    }

    auto skipped = std::vector<char>(entries.size());
    auto progress_mutex = std::mutex{};
    auto workers = Workers(options.parallel);
    auto const results = workers.map(entries.size(), [&](std::size_t i) -> std::uint64_t {
        auto entry = entries[i];
        struct Notify {
            progress_cb progress;
            std::mutex& mutex;
            ARH::Entry const& entry;
            ~Notify() {
                if (progress) {
                    std::lock_guard lock(mutex);
                    progress(entry);
                }
            }
        } notify = {progress, progress_mutex, entry};

        auto data = extract_entry(ard, entry, options.verify);
        if (entry.storage == ARH::Storage::Detect) {
            entry.uncompressed_size = (std::uint32_t)data.size();
            entry.type = classify(data);
            if (filter && !filter(entry)) {
                skipped[i] = true;
                return 0;
            }
        }
        if (owners[i]) {
            xblib_error(Errc::Format, fmt::format("Output file is already written by entry {}!", *owners[i]).c_str());
        }
        if (!options.dry_run) {
            auto const path = output_path(options.output, entry);
            xblib_trace("path: {}", path.generic_string());
            auto file = IO::File(path, IO::WRITE);
            xblib_assert_io(file.truncate(0));
            xblib_assert_io(file.write(0, data));
        }
        return data.size();
    });

    auto report = Report{};
    for (auto const& result : results) {
        if (skipped[result.index]) {
            continue;
        }
        ++report.total;
        if (result) {
            ++report.succeeded;
            report.bytes += result.bytes;
        } else {
            report.failures.push_back({.index = entries[result.index].index, .error = result.error});
        }
    }
    return report;
}

auto Archive::prepare(BuildOptions const& options, Input const& input, std::uint32_t index, classify_cb classify)
    -> Prepared {
    xblib_trace("input: {}", input.path.generic_string());
    auto data = Buffer{};
    {
        auto const file = IO::File(input.path, IO::READ | IO::SEQUENTIAL);
        xblib_assert_io(file.size() <= 0xFFFFFFFFull);
        xblib_assert_io(data.reset(file.size()));
        xblib_assert_io(file.read(0, data));
    }

    auto entry = ARH::Entry{
        .index = index,
        .offset = {},
        .stored_size = {},
        .uncompressed_size = (std::uint32_t)data.size(),
        .id = cache_id(input.relative),
        .name = options.names ? input.relative : std::string{},
        .storage = ARH::Storage::Raw,
        .type = classify ? classify(data) : FileType::Unknown,
    };

    // Already packed inputs are stored as is so extraction returns them unchanged.
    if (options.compress && !XBC1::check_magic(data)) {
        auto const kind = options.kind.value_or(data.size() > MiB ? XBC1::Kind::Zstd : XBC1::Kind::Zlib);
        auto packed = XBC1::encode(data, kind, options.level, fs::path(input.relative).filename().string());
        if (!options.raw_fallback || packed.size() < data.size()) {
            data = std::move(packed);
            entry.storage = ARH::Storage::XBC1;
        }
    }
    xblib_assert_io(data.size() <= 0xFFFFFFFFull);
    entry.stored_size = (std::uint32_t)data.size();
    return {.data = std::move(data), .entry = std::move(entry)};
}

auto Archive::build(BuildOptions const& options, classify_cb classify, progress_cb progress) -> ARH {
    xblib_assert(options.alignment != 0 && std::has_single_bit(options.alignment));
    xblib_assert(options.inputs.size() < ARH::NO_NAME);

    auto inputs = std::vector<Input>{};
    inputs.reserve(options.inputs.size());
    for (auto const& path : options.inputs) {
        auto relative = options.root.empty() ? path.filename().generic_string() : fs_relative(path, options.root);
        inputs.push_back({.path = path, .relative = std::move(relative)});
    }
    std::sort(inputs.begin(), inputs.end(), [](Input const& lhs, Input const& rhs) {
        return lhs.relative < rhs.relative;
    });
    for (std::size_t i = 1; i < inputs.size(); ++i) {
        xblib_trace("name: {}", inputs[i].relative);
        xblib_assert(inputs[i - 1].relative != inputs[i].relative);
    }

    xblib_trace("arh: {}", options.arh.generic_string());
    xblib_rethrow(fs::remove(options.arh));
    auto tmp_arh = options.arh;
    tmp_arh += ".tmp";

    auto result = ARH{.alignment = options.alignment, .entries = std::vector<ARH::Entry>(inputs.size())};
    // Unnamed entries extract to {id}{extension}, two of them must not share a file.
    auto unnamed = std::set<std::pair<std::uint64_t, FileType>>{};
    try {
        {
            auto writer = ARD::Writer(options.ard, options.alignment);
            auto workers = Workers(options.parallel);
            workers.ordered<Prepared>(
                inputs.size(),
                workers.size() * 2,
                [&](std::size_t index) -> Prepared {
                    return prepare(options, inputs[index], (std::uint32_t)index, classify);
                },
                [&](std::size_t index, Prepared&& prepared) {
                    auto& entry = result.entries[index];
                    entry = std::move(prepared.entry);
                    if (!options.names) {
                        xblib_trace("input: {}", inputs[index].relative);
                        xblib_assert(unnamed.emplace(entry.id, entry.type).second);
                    }
                    entry.offset = writer.append(prepared.data).offset;
                    if (progress) {
                        progress(entry);
                    }
                });
        }
        auto const toc = result.write();
        {
            auto file = IO::File(tmp_arh, IO::WRITE);
            xblib_assert_io(file.truncate(0));
            xblib_assert_io(file.write(0, toc));
        }
        xblib_rethrow(fs::rename(tmp_arh, options.arh));
    } catch (std::exception const&) {
        // Best effort, the first error is the one rethrown.
        auto ec = std::error_code{};
        fs::remove(tmp_arh, ec);
        fs::remove(options.ard, ec);
        throw;
    }
    return result;
}
