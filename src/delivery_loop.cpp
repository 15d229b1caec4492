#include "delivery_loop.hpp"

#include <iostream>

namespace mvpbind {

std::shared_ptr<DeliveryLoop> DeliveryLoop::create(Executor& executor,
                                                   Sink sink,
                                                   size_t thinning_factor,
                                                   Callback after_drain) {
    return std::make_shared<DeliveryLoop>(Key{}, executor, std::move(sink),
                                          thinning_factor, std::move(after_drain));
}

DeliveryLoop::DeliveryLoop(Key, Executor& executor, Sink sink, size_t thinning_factor,
                           Callback after_drain)
    : executor_(executor)
    , sink_(std::move(sink))
    , after_drain_(std::move(after_drain))
    , queue_(thinning_factor)
{}

void DeliveryLoop::post(StatePtr state) {
    queue_.post(std::move(state));
    if (is_permitted() && try_enter(DeliveryState::Idle)) {
        std::weak_ptr<DeliveryLoop> weak = shared_from_this();
        executor_.execute([weak]() {
            if (auto self = weak.lock()) self->run_scheduled();
        });
    }
}

void DeliveryLoop::set_enabled(bool value) {
    bool expected = !value;
    if (enabled_.compare_exchange_strong(expected, value) && is_permitted()) {
        flush();
    }
}

void DeliveryLoop::on_resumed() {
    resumed_.store(true);
    if (!is_permitted()) return;

    StatePtr last = last_delivered();
    if (queue_.empty() && last) {
        // Nothing arrived while paused: redeliver what the view last saw
        DeliveryState expected = DeliveryState::Idle;
        if (!state_.compare_exchange_strong(expected, DeliveryState::Draining)) return;
        deliver(last);
        drain_while_owned();
        return;
    }
    flush();
}

void DeliveryLoop::on_paused() {
    resumed_.store(false);
}

StatePtr DeliveryLoop::last_delivered() const {
    std::lock_guard<std::mutex> lock(last_mutex_);
    return last_delivered_;
}

// Idle -> Scheduled for post(); the scheduled task then moves on to Draining.
bool DeliveryLoop::try_enter(DeliveryState from) {
    DeliveryState next = from == DeliveryState::Idle ? DeliveryState::Scheduled
                                                     : DeliveryState::Draining;
    return state_.compare_exchange_strong(from, next);
}

void DeliveryLoop::run_scheduled() {
    if (!try_enter(DeliveryState::Scheduled)) return;
    drain_while_owned();
}

void DeliveryLoop::flush() {
    DeliveryState expected = DeliveryState::Idle;
    if (!state_.compare_exchange_strong(expected, DeliveryState::Draining)) {
        // A drain is already scheduled or running and will see the queue
        return;
    }
    drain_while_owned();
}

// Caller holds the Draining state.
void DeliveryLoop::drain_while_owned() {
    for (;;) {
        queue_.drain([this](const StatePtr& state) { deliver(state); },
                     [this]() { return is_permitted(); });

        // Release first, then look again: a post() that raced with the
        // release either saw Idle and scheduled its own drain, or its item
        // is visible here.
        state_.store(DeliveryState::Idle);
        if (queue_.empty() || !is_permitted()) break;

        DeliveryState expected = DeliveryState::Idle;
        if (!state_.compare_exchange_strong(expected, DeliveryState::Draining)) break;
    }
    if (after_drain_) after_drain_();
}

void DeliveryLoop::deliver(const StatePtr& state) {
    {
        std::lock_guard<std::mutex> lock(last_mutex_);
        last_delivered_ = state;
    }
    try {
        sink_(*state);
    } catch (const std::exception& e) {
        std::cerr << "[delivery] State handling error: " << e.what() << "\n";
    }
}

} // namespace mvpbind
