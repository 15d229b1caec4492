#include "executor.hpp"

#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace mvpbind {

SerialExecutor::SerialExecutor(std::string name)
    : name_(std::move(name))
{
    thread_ = std::thread([this]() { run_loop(); });
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

void SerialExecutor::execute(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            std::cerr << "[executor] " << name_ << ": task submitted after shutdown, dropped\n";
            return;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void SerialExecutor::flush() {
    if (is_worker_thread()) {
        throw std::logic_error("SerialExecutor::flush called from its own worker: " + name_);
    }
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        tasks_.push_back([done]() { done->set_value(); });
    }
    cv_.notify_one();
    future.wait();
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_one();
    if (thread_.joinable() && !is_worker_thread()) {
        thread_.join();
    }
}

bool SerialExecutor::is_worker_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void SerialExecutor::run_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            // Queued tasks still run after shutdown was requested
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[executor] " << name_ << ": task failed: " << e.what() << "\n";
        }
    }
}

} // namespace mvpbind
