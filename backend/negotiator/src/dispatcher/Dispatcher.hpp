#pragma once
#include <queue>
#include <mutex>
#include <functional>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace negotiator::dispatch {

// Single worker thread. Every session operation and transport notification is posted here,
// which keeps sessions single-threaded.
class Dispatcher {
public:
    ~Dispatcher();
    void start();
    void stop();
    void post(std::function<void()> task);
    bool isCurrentThread() const;

private:
    std::mutex mutex_;
    std::queue<std::function<void()>> taskQueue_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{false};
};

}
