#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <utility>

#include "common.hpp"

namespace xblib {
    struct Workers {
        struct Result {
            std::size_t index = {};
            std::uint64_t bytes = {};
            std::string error = {};

            explicit operator bool() const noexcept { return error.empty(); }
        };

        using job_t = std::function<void()>;

        // parallel 0 selects host concurrency, larger values are capped to it.
        explicit Workers(std::uint32_t parallel = 0);
        ~Workers() noexcept;

        Workers(Workers const&) = delete;
        Workers& operator=(Workers const&) = delete;

        static auto concurrency(std::uint32_t parallel) noexcept -> std::uint32_t;

        auto size() const noexcept -> std::size_t { return threads_.size(); }

        // Jobs must not throw, map and ordered wrap theirs.
        auto submit(job_t job) -> void;

        // Blocks until the queue is empty and no job is running.
        auto wait() -> void;

        // Runs job for every index, results are stored by index regardless of completion order.
        auto map(std::size_t count, function_ref<std::uint64_t(std::size_t index)> job) -> std::vector<Result>;

        // Runs produce in parallel and consume on the calling thread in index order, keeping at most
        // window produced values alive. The first failure stops remaining producers and is rethrown.
        template <typename T>
        auto ordered(std::size_t count,
                     std::size_t window,
                     function_ref<T(std::size_t index)> produce,
                     function_ref<void(std::size_t index, T&& value)> consume) -> void;

    private:
        struct Drain {
            Workers& workers;
            ~Drain() { workers.wait(); }
        };

        auto run() -> void;

        std::vector<std::thread> threads_;
        std::queue<job_t> jobs_;
        std::size_t active_ = {};
        bool stop_ = {};
        std::mutex mutex_;
        std::condition_variable ready_;
        std::condition_variable idle_;
    };

    template <typename T>
    auto Workers::ordered(std::size_t count,
                          std::size_t window,
                          function_ref<T(std::size_t index)> produce,
                          function_ref<void(std::size_t index, T&& value)> consume) -> void {
        struct Slot {
            std::optional<T> value = {};
            std::exception_ptr error = {};
            error_stack_t trace = {};
            bool done = {};
        };
        auto slots = std::vector<Slot>(count);
        auto mutex = std::mutex{};
        auto done = std::condition_variable{};
        auto stop = false;
        auto submitted = std::size_t{};
        auto drain = Drain{*this};

        auto submit_next = [&] {
            auto const index = submitted++;
            this->submit([&, index] {
                auto slot = Slot{};
                {
                    std::lock_guard lock(mutex);
                    if (stop) {
                        slots[index].done = true;
                        done.notify_all();
                        return;
                    }
                }
                try {
                    slot.value.emplace(produce(index));
                } catch (std::exception const&) {
                    slot.error = std::current_exception();
                    slot.trace = std::exchange(error_stack(), {});
                }
                slot.done = true;
                std::lock_guard lock(mutex);
                slots[index] = std::move(slot);
                done.notify_all();
            });
        };

        window = std::max(window, std::size_t{1});
        while (submitted != count && submitted != window) {
            submit_next();
        }
        for (std::size_t index = 0; index != count; ++index) {
            auto slot = Slot{};
            {
                std::unique_lock lock(mutex);
                done.wait(lock, [&] { return slots[index].done; });
                slot = std::move(slots[index]);
                if (slot.error) {
                    stop = true;
                }
            }
            if (slot.error) {
                auto& stack = error_stack();
                stack.insert(stack.end(), slot.trace.begin(), slot.trace.end());
                std::rethrow_exception(slot.error);
            }
            try {
                consume(index, std::move(*slot.value));
            } catch (std::exception const&) {
                std::lock_guard lock(mutex);
                stop = true;
                throw;
            }
            if (submitted != count) {
                submit_next();
            }
        }
    }
}
