#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace doc_structure {

// Fixed-size worker pool used to retrieve pages concurrently.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>>;

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable task_ready_;
    bool stopping_ = false;
};

template<typename F>
auto ThreadPool::enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
    using result_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(f));
    std::future<result_type> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    task_ready_.notify_one();
    return result;
}

} // namespace doc_structure
