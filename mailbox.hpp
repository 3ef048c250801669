#pragma once

#include <atomic>
#include <exception>
#include <iostream>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>

namespace relaylog {

// FIFO message queue drained by one worker thread. Messages from one posting
// thread run in the order they were posted, never two at a time.
class Mailbox {
public:
    using Message = std::function<void()>;

    Mailbox()
        : shutdown_requested_(false)
    {
        worker_thread_ = std::thread([this] { process_messages(); });
        worker_id_ = worker_thread_.get_id();
    }

    ~Mailbox() {
        shutdown();
    }

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    // Never blocks on the message itself. Returns false once shut down.
    bool post(Message message) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_requested_.load()) {
                return false;
            }
            queue_.push(std::move(message));
        }
        queue_condition_.notify_one();
        return true;
    }

    // Blocks until every message posted before this call has run
    void drain() {
        if (std::this_thread::get_id() == worker_id_) {
            return;
        }
        auto done = std::make_shared<std::promise<void>>();
        auto finished = done->get_future();
        if (!post([done] { done->set_value(); })) {
            return;
        }
        finished.wait();
    }

    // Runs what is already queued, then stops the worker. Must not be called
    // from inside a message.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (shutdown_requested_.exchange(true)) {
                return;
            }
        }
        queue_condition_.notify_all();
        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
    }

    bool is_running() const noexcept {
        return !shutdown_requested_.load();
    }

private:
    std::queue<Message> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::atomic<bool> shutdown_requested_;
    std::thread worker_thread_;
    std::thread::id worker_id_;

    void process_messages() {
        while (true) {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            queue_condition_.wait(lock, [this] {
                return shutdown_requested_.load() || !queue_.empty();
            });

            while (!queue_.empty()) {
                Message message = std::move(queue_.front());
                queue_.pop();
                lock.unlock();

                try {
                    message();
                } catch (const std::exception& e) {
                    std::cerr << "relaylog: message failed: " << e.what() << '\n';
                } catch (...) {
                    std::cerr << "relaylog: message failed: unknown exception\n";
                }

                lock.lock();
            }

            if (shutdown_requested_.load()) {
                break;
            }
        }
    }
};

} // namespace relaylog
