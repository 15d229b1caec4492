#pragma once
#include "executor.hpp"
#include "state_queue.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace mvpbind {

enum class DeliveryState { Idle, Scheduled, Draining };

// Per-binding delivery controller. Owns the binding's StateQueue and decides
// when it is drained into the sink.
//
// Delivery is permitted while the view is both enabled (ready to render) and
// resumed (in the foreground). Drains run on the delivery executor, or
// synchronously from set_enabled()/on_resumed(), which the lifecycle side
// calls on the delivery thread. The Idle/Scheduled/Draining state admits a
// single drain at a time.
class DeliveryLoop : public std::enable_shared_from_this<DeliveryLoop> {
public:
    using Sink = std::function<void(const State&)>;
    using Callback = std::function<void()>;

    // sink: hands one snapshot to the view; exceptions it throws are logged
    // after_drain: runs after every drain pass (liveness poll)
    static std::shared_ptr<DeliveryLoop> create(Executor& executor,
                                                Sink sink,
                                                size_t thinning_factor = kDefaultThinningFactor,
                                                Callback after_drain = nullptr);

private:
    // Only create() can name this, so the constructor stays effectively private
    struct Key { explicit Key() = default; };

public:
    DeliveryLoop(Key, Executor& executor, Sink sink, size_t thinning_factor,
                 Callback after_drain);

    DeliveryLoop(const DeliveryLoop&) = delete;
    DeliveryLoop& operator=(const DeliveryLoop&) = delete;

    // Enqueue; schedules a drain when permitted and idle. Any thread.
    void post(StatePtr state);

    // A false->true edge while resumed drains immediately.
    void set_enabled(bool value);

    void on_resumed();
    void on_paused();

    bool is_enabled() const { return enabled_.load(); }
    bool is_resumed() const { return resumed_.load(); }
    bool is_permitted() const { return is_enabled() && is_resumed(); }

    DeliveryState state() const { return state_.load(); }
    StatePtr last_delivered() const;
    size_t pending() const { return queue_.size(); }

private:
    bool try_enter(DeliveryState from);
    void run_scheduled();
    void flush();
    void drain_while_owned();
    void deliver(const StatePtr& state);

    Executor& executor_;
    Sink sink_;
    Callback after_drain_;
    StateQueue queue_;

    std::atomic<bool> enabled_{false};
    std::atomic<bool> resumed_{false};
    std::atomic<DeliveryState> state_{DeliveryState::Idle};

    mutable std::mutex last_mutex_;
    StatePtr last_delivered_;
};

} // namespace mvpbind
