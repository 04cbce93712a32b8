#include "workers.hpp"

using namespace xblib;

Workers::Workers(std::uint32_t parallel) {
    auto const count = concurrency(parallel);
    threads_.reserve(count);
    for (std::uint32_t i = 0; i != count; ++i) {
        threads_.emplace_back([this] { this->run(); });
    }
}

Workers::~Workers() noexcept {
    {
        std::lock_guard lock(mutex_);
        stop_ = true;
    }
    ready_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

auto Workers::concurrency(std::uint32_t parallel) noexcept -> std::uint32_t {
    auto const host = std::max(1u, std::thread::hardware_concurrency());
    return parallel == 0 ? host : std::min(parallel, host);
}

auto Workers::submit(job_t job) -> void {
    {
        std::lock_guard lock(mutex_);
        xblib_assert_errc(Errc::IO, !stop_);
        jobs_.push(std::move(job));
    }
    ready_.notify_one();
}

auto Workers::wait() -> void {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this] { return jobs_.empty() && active_ == 0; });
}

auto Workers::map(std::size_t count, function_ref<std::uint64_t(std::size_t index)> job) -> std::vector<Result> {
    auto results = std::vector<Result>(count);
    {
        auto drain = Drain{*this};
        for (std::size_t index = 0; index != count; ++index) {
            this->submit([&results, job, index] {
                auto& result = results[index];
                result.index = index;
                try {
                    result.bytes = job(index);
                } catch (std::exception const& e) {
                    result.error = error_message(e);
                }
            });
        }
    }
    return results;
}

auto Workers::run() -> void {
    for (;;) {
        auto job = job_t{};
        {
            std::unique_lock lock(mutex_);
            ready_.wait(lock, [this] { return stop_ || !jobs_.empty(); });
            if (stop_ && jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
            ++active_;
        }
        job();
        {
            std::lock_guard lock(mutex_);
            --active_;
            if (jobs_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}
