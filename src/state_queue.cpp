#include "state_queue.hpp"
#include <stdexcept>

namespace mvpbind {

StateQueue::StateQueue(size_t thinning_factor)
    : thinning_factor_(thinning_factor)
{
    if (thinning_factor_ == 0) {
        throw std::invalid_argument("StateQueue thinning factor must be at least 1");
    }
}

void StateQueue::post(StatePtr state) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back(std::move(state));
}

size_t StateQueue::drain(const Deliver& deliver, const Permitted& permitted) {
    size_t n = size() / thinning_factor_;
    size_t forwarded = 0;

    while (permitted()) {
        StatePtr state;
        size_t remaining = 0;
        if (!pop(state, remaining)) break;

        // Under backlog forward every n'th snapshot counted from the end
        if (n == 0 || remaining % n == 0) {
            deliver(state);
            ++forwarded;
            n = remaining / thinning_factor_;
        }
    }
    return forwarded;
}

size_t StateQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool StateQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
}

void StateQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
}

bool StateQueue::pop(StatePtr& out, size_t& remaining) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    remaining = items_.size();
    return true;
}

} // namespace mvpbind
