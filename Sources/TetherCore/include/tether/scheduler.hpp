#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <atomic>

namespace tether {

// ============================================================================
// Scheduler interface - abstract base for work dispatch
// ============================================================================
//
// A scheduler is an execution context. The sync coordinator uses one as its
// mailbox (all orchestration state is touched only from there) and one per
// sync cycle for network and store I/O. The local store uses one to deliver
// change notifications to readers; hosts with a UI thread supply their own.

struct scheduler {
    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // Check if this scheduler wraps the same underlying context as another.
    [[nodiscard]] virtual bool is_same_as(const scheduler* other) const noexcept = 0;

    // Check if invoke() is currently possible.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using SharedScheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Thread scheduler - runs callbacks on a dedicated worker thread
// ============================================================================
//
// Work is executed strictly in submission order. The destructor drains the
// queue before joining.

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : running_(true) {
        worker_ = std::thread([this] { run_loop(); });
        thread_id_ = worker_.get_id();
    }

    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void invoke(std::function<void()>&& fn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            queue_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        auto* g = dynamic_cast<const std_thread_scheduler*>(other);
        return g && g->thread_id_ == thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

private:
    void run_loop() {
        while (true) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

                if (!running_ && queue_.empty()) {
                    return;
                }

                fn = std::move(queue_.front());
                queue_.pop();
            }

            if (fn) {
                fn();
            }
        }
    }

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
};

// ============================================================================
// Immediate scheduler - runs callbacks synchronously on calling thread
// ============================================================================
//
// Useful for testing or single-threaded applications.

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        return dynamic_cast<const immediate_scheduler*>(other) != nullptr;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

} // namespace tether
