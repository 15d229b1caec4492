#include "weak_view_ref.hpp"

namespace mvpbind {

WeakViewRef::WeakViewRef(const std::shared_ptr<View>& view)
    : ref_(view)
{}

bool WeakViewRef::expunge_if_reclaimed(const std::function<void()>& on_reclaimed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reported_ || !ref_.expired()) return false;
    reported_ = true;
    if (on_reclaimed) on_reclaimed();
    return true;
}

bool WeakViewRef::reclaim_reported() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reported_;
}

} // namespace mvpbind
