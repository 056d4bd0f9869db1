#pragma once
#include <asio.hpp>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace pcex {

// Runs blocking operations off the caller's thread. Work submitted together
// still reaches the session one exchange at a time.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads) : pool_(threads) {}
    ~WorkerPool() { pool_.join(); }
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        asio::post(pool_, [task]() { (*task)(); });
        return fut;
    }

    void join() { pool_.join(); }

private:
    asio::thread_pool pool_;
};

} // namespace pcex
