#pragma once
#include <string>
#include <deque>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>

namespace mvpbind {

using Task = std::function<void()>;

// Abstract task sink. The delivery thread and presenter lanes are both
// executors; tests substitute a manually pumped one.
class Executor {
public:
    virtual ~Executor() = default;

    // Submit a task. Must not block the caller.
    virtual void execute(Task task) = 0;
};

// One worker thread draining a FIFO of tasks. Tasks run strictly in
// submission order, never concurrently with each other.
class SerialExecutor : public Executor {
public:
    explicit SerialExecutor(std::string name);
    ~SerialExecutor() override;

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    void execute(Task task) override;

    // Block until every task submitted before this call has run.
    // Throws std::logic_error when called from the worker thread itself.
    void flush();

    // Run what is already queued, then stop and join the worker.
    // Later submissions are dropped with a warning. Idempotent.
    void shutdown();

    bool is_worker_thread() const;
    size_t pending() const;
    const std::string& name() const { return name_; }

private:
    void run_loop();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace mvpbind
