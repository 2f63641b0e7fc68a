#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <memory>
#include <type_traits>

namespace dircopy::infra {

/// Пул рабочих потоков фиксированного размера.
/// Создаётся на время одного вызова и разрушается в его конце:
/// деструктор дожидается выполнения всех поставленных задач.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Запуск задачи с возвратом (future). Исключение задачи попадает в future.
    template<typename F>
    auto enqueue_with_future(F&& f)
        -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Блокирующее ожидание завершения всех задач
    void wait();

    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

private:
    using Task = std::function<void()>;

    void worker_loop_(std::stop_token st);

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    bool stop_ = false;
    std::size_t active_tasks_ = 0; // поставлено, но ещё не завершено; под queue_mutex_

    // Последним: потоки join-ятся раньше, чем разрушаются очередь и мьютекс
    std::vector<std::jthread> workers_;
};

// =============== Реализация шаблонов ===============

template<typename F>
auto ThreadPool::enqueue_with_future(F&& f)
    -> std::future<std::invoke_result_t<std::decay_t<F>>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
    auto future = task->get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        ++active_tasks_;
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads) {
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
        worker.join();
    }
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            // При остановке сначала дорабатываем очередь
            if (tasks_.empty()) {
                if (stop_ || st.stop_requested()) {
                    return;
                }
                continue;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return active_tasks_ == 0; });
}

} // namespace dircopy::infra
