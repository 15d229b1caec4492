#pragma once
#include "state.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <cstddef>

namespace mvpbind {

constexpr size_t kDefaultThinningFactor = 8;

// FIFO of state snapshots between a presenter and one view.
//
// post() is safe from any thread and never blocks on delivery. drain() must
// only be entered by one drainer at a time (DeliveryLoop guarantees this).
//
// Storage is unbounded; under backlog drain() forwards a subsample instead
// of every stale snapshot. With n = backlog / thinning_factor an item is
// forwarded when the number of items behind it is a multiple of n, and n is
// recomputed after each forward. The last item of a backlog has nothing
// behind it, so it is always forwarded.
class StateQueue {
public:
    using Deliver = std::function<void(const StatePtr&)>;
    using Permitted = std::function<bool()>;

    // Throws std::invalid_argument if thinning_factor is 0.
    explicit StateQueue(size_t thinning_factor = kDefaultThinningFactor);

    void post(StatePtr state);

    // Pop while permitted() holds and the queue is non-empty.
    // Returns the number of snapshots handed to deliver.
    size_t drain(const Deliver& deliver, const Permitted& permitted);

    size_t size() const;
    bool empty() const;
    void clear();

    size_t thinning_factor() const { return thinning_factor_; }

private:
    // Pops the front item and reports how many remain behind it.
    bool pop(StatePtr& out, size_t& remaining);

    const size_t thinning_factor_;
    mutable std::mutex mutex_;
    std::deque<StatePtr> items_;
};

} // namespace mvpbind
