#include "Dispatcher.hpp"

#include <exception>
#include <plog/Log.h>

using namespace negotiator::dispatch;

void Dispatcher::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return !taskQueue_.empty() || !running_; });
                if (taskQueue_.empty())
                    break;
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            try {
                task();
            } catch (const std::exception& ex) {
                PLOG_ERROR << "Dispatched task threw: " << ex.what();
            }
        }
    });
}

void Dispatcher::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taskQueue_.push(std::move(task));
    }
    cv_.notify_one();
}

bool Dispatcher::isCurrentThread() const {
    return worker_.get_id() == std::this_thread::get_id();
}

// Pending tasks still run before the worker exits.
void Dispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (worker_.joinable() && !isCurrentThread())
        worker_.join();
}

Dispatcher::~Dispatcher() {
    stop();
    if (worker_.joinable())
        worker_.detach();
}
