#include "wsp/concurrency.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace wsp {

// ---------------------- ThreadPool implementation ----------------------

struct ThreadPool::Impl {
    using Task = std::function<void(const std::atomic<bool>&)>;

    explicit Impl(int n)
    {
        if (n <= 0) n = 1;
        workers.reserve(n);
        for (int i = 0; i < n; ++i)
        {
            workers.emplace_back([this]{ this->run_worker(); });
        }
    }

    ~Impl()
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            stopping = true;
        }
        cv_task.notify_all();
        for (auto& th : workers) if (th.joinable()) th.join();
    }

    bool enqueue(Task task)
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            // nothing new starts once the pool is stopping or cancelled
            if (stopping || cancelled.load(std::memory_order_relaxed)) return false;
            pending.push(std::move(task));
        }
        cv_task.notify_one();
        return true;
    }

    void wait_idle()
    {
        std::unique_lock<std::mutex> lk(mtx);
        cv_idle.wait(lk, [&]{ return pending.empty() && running == 0; });
    }

    // Raises the flag and discards queued tasks; returns how many were dropped.
    std::size_t cancel()
    {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lk(mtx);
            cancelled.store(true, std::memory_order_relaxed);
            dropped = pending.size();
            std::queue<Task>().swap(pending);
            if (running == 0) cv_idle.notify_all();
        }
        return dropped;
    }

    void record_exception(std::exception_ptr ep)
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (!first_ex) first_ex = std::move(ep);
    }

    void run_worker()
    {
        for (;;)
        {
            Task task;
            {
                std::unique_lock<std::mutex> lk(mtx);
                cv_task.wait(lk, [&]{ return stopping || !pending.empty(); });
                if (pending.empty()) return; // stopping
                task = std::move(pending.front());
                pending.pop();
                ++running;
            }
            try {
                task(cancelled);
            } catch (...) {
                record_exception(std::current_exception());
                (void) cancel();
            }
            {
                std::lock_guard<std::mutex> lk(mtx);
                if (--running == 0 && pending.empty()) cv_idle.notify_all();
            }
        }
    }

    mutable std::mutex mtx;
    std::condition_variable cv_task;
    std::condition_variable cv_idle;
    std::queue<Task> pending;
    std::vector<std::thread> workers;
    bool stopping = false;
    std::size_t running = 0;
    std::atomic<bool> cancelled{false};
    std::exception_ptr first_ex;
};

ThreadPool::ThreadPool(int threads)
  : impl_(new Impl(threads))
{}

ThreadPool::~ThreadPool()
{
    delete impl_;
}

bool ThreadPool::submit_cancelable(std::function<void(const std::atomic<bool>&)> task)
{
    return impl_->enqueue(std::move(task));
}

void ThreadPool::wait_idle()
{
    impl_->wait_idle();
}

std::size_t ThreadPool::cancel()
{
    return impl_->cancel();
}

const std::atomic<bool>& ThreadPool::cancel_flag() const
{
    return impl_->cancelled;
}

std::exception_ptr ThreadPool::first_exception() const
{
    std::lock_guard<std::mutex> lk(impl_->mtx);
    return impl_->first_ex;
}

} // namespace wsp
