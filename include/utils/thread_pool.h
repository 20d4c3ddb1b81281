// thread_pool.h
#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

class ThreadPool {
public:
    explicit ThreadPool(size_t n = std::thread::hardware_concurrency()) {
        if (n == 0) n = 1;
        workers.reserve(n);
        for (size_t i = 0; i < n; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    // Waits for every queued and running task, abandoned ones included
    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stop_flag = true;
        }
        cv.notify_all();
        for (auto &t : workers) if (t.joinable()) t.join();
    }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {
        using Ret = std::invoke_result_t<F, Args...>;
        auto task_ptr = std::make_shared<std::packaged_task<Ret()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        std::future<Ret> fut = task_ptr->get_future();
        enqueue([task_ptr] { (*task_ptr)(); });
        return fut;
    }

    /**
     * Runs f on a worker and gives it `timeout` to finish, counted from the
     * moment a worker starts it (time spent queued does not count).
     *
     * Returns std::nullopt on timeout. A timed out task cannot be interrupted:
     * it keeps its worker until it returns, so it must own everything it
     * touches. The next run_with_timeout call first waits for every such
     * abandoned task, so runs never overlap with leftovers of earlier ones.
     * Exceptions thrown by f are rethrown here.
     */
    template<typename F, typename Rep, typename Period>
    auto run_with_timeout(F&& f, std::chrono::duration<Rep, Period> timeout)
        -> std::optional<std::invoke_result_t<F>> {
        using Ret = std::invoke_result_t<F>;
        drain_abandoned();

        auto started = std::make_shared<std::promise<void>>();
        auto finished = std::make_shared<std::promise<void>>();
        std::future<void> started_fut = started->get_future();
        std::shared_future<void> finished_fut = finished->get_future().share();

        auto fut = submit([started, finished, fn = std::forward<F>(f)]() mutable -> Ret {
            FinishSignal signal{finished};
            started->set_value();
            return fn();
        });

        started_fut.wait();
        if (fut.wait_for(timeout) != std::future_status::ready) {
            std::lock_guard<std::mutex> lock(abandoned_mtx);
            abandoned.push_back(std::move(finished_fut));
            return std::nullopt;
        }
        return fut.get();
    }

    // Blocks until every task given up by run_with_timeout has returned
    void drain_abandoned() {
        std::vector<std::shared_future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(abandoned_mtx);
            pending.swap(abandoned);
        }
        for (auto &f : pending) f.wait();
    }

    size_t abandoned_count() const {
        std::lock_guard<std::mutex> lock(abandoned_mtx);
        return abandoned.size();
    }

    size_t size() const { return workers.size(); }

private:
    // Fulfils its promise when the task body leaves, normally or by exception
    struct FinishSignal {
        std::shared_ptr<std::promise<void>> done;
        ~FinishSignal() { done->set_value(); }
    };

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool stop_flag = false;

    std::vector<std::shared_future<void>> abandoned;
    mutable std::mutex abandoned_mtx;

    void enqueue(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (stop_flag) throw std::runtime_error("submit on stopped ThreadPool");
            tasks.push(std::move(task));
        }
        cv.notify_one();
    }

    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv.wait(lock, [this] { return stop_flag || !tasks.empty(); });
                if (stop_flag && tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop();
            }
            task();
        }
    }
};
