#pragma once
#include "view.hpp"
#include <functional>
#include <memory>
#include <mutex>

namespace mvpbind {

// Weak reference to a view plus a one-shot "reclaimed" notification.
//
// expunge_if_reclaimed() is the poll: the first call that finds the view
// gone runs the callback, every later call is a no-op. The check and the
// callback run under a lock owned by this reference, so two threads polling
// the same binding never both run cleanup.
class WeakViewRef {
public:
    explicit WeakViewRef(const std::shared_ptr<View>& view);

    std::shared_ptr<View> lock() const { return ref_.lock(); }
    bool expired() const { return ref_.expired(); }

    bool expunge_if_reclaimed(const std::function<void()>& on_reclaimed);

    // True once a poll has observed and reported the reclaim
    bool reclaim_reported() const;

private:
    std::weak_ptr<View> ref_;
    mutable std::mutex mutex_;
    bool reported_ = false;
};

} // namespace mvpbind
