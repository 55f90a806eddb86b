#pragma once

#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace subvault {
namespace utils {

// Fixed set of workers draining a FIFO of jobs. Jobs queued before
// shutdown() still run; later submissions throw.
class ThreadPool {
public:
    explicit ThreadPool(size_t threads) {
        if (threads == 0) threads = 1;
        workers_.reserve(threads);
        for (size_t i = 0; i < threads; i++) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // The job's result, or the exception it threw, arrives through the future.
    template<class Job>
    std::future<std::invoke_result_t<Job>> enqueue(Job&& job) {
        using R = std::invoke_result_t<Job>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Job>(job));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) throw std::runtime_error("thread pool is shut down");
            jobs_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    size_t size() const { return workers_.size(); }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

private:
    void workerLoop() {
        std::unique_lock<std::mutex> lock(mtx_);
        for (;;) {
            cv_.wait(lock, [this] { return closed_ || !jobs_.empty(); });
            if (jobs_.empty()) return;
            std::function<void()> job = std::move(jobs_.front());
            jobs_.pop_front();
            lock.unlock();
            job();
            lock.lock();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool closed_ = false;
};

}
}
