#pragma once
#include "delivery_loop.hpp"
#include "executor.hpp"
#include "presenter.hpp"
#include "view.hpp"
#include "weak_view_ref.hpp"
#include <functional>
#include <memory>
#include <string>

namespace mvpbind {

// Binds one view instance to its presenter.
//
// The view (or whoever owns it) holds the binding strongly and must call
// disconnect() when it is torn down. The binding holds the view weakly; if
// the view is destroyed without disconnecting, the next operation on the
// binding notices and disconnects on its behalf, once.
//
// Lifecycle signals (set_enabled, on_resumed, on_paused) are expected on
// the delivery thread. post() and the host actions may come from any thread.
class ViewBinding : public ViewHandle,
                    public std::enable_shared_from_this<ViewBinding> {
public:
    // Throws std::invalid_argument when view or presenter is null.
    static std::shared_ptr<ViewBinding> create(const std::shared_ptr<View>& view,
                                               std::shared_ptr<Presenter> presenter,
                                               Executor& delivery,
                                               size_t thinning_factor = kDefaultThinningFactor);

private:
    struct Key { explicit Key() = default; };

public:
    ViewBinding(Key, const std::shared_ptr<View>& view,
                std::shared_ptr<Presenter> presenter,
                Executor& delivery);

    ViewBinding(const ViewBinding&) = delete;
    ViewBinding& operator=(const ViewBinding&) = delete;

    // ── ViewHandle ──────────────────────────────────────────────
    void post(StatePtr state) override;
    void finish() override;
    void show_message(const std::string& text, MessageDuration duration) override;
    void start_host_action(HostAction action) override;
    std::shared_ptr<View> view() const override;
    Arguments arguments() const override;
    bool expunge_if_reclaimed() override;

    // ── View side ───────────────────────────────────────────────
    void connect();
    void disconnect();

    // Hold delivery until the view can render (e.g. menus not built yet)
    void set_enabled(bool value);

    void on_resumed();
    void on_paused();

    // Route the host's answer to a HostAction with a request_code back to
    // the presenter. Dropped once the binding is disconnected.
    void deliver_action_result(int request_code, int result_code,
                               nlohmann::json data = nlohmann::json::object());

    const Presenter& presenter() const { return *presenter_; }
    const DeliveryLoop& delivery() const { return *loop_; }

private:
    // Post fn to the delivery thread; it runs only if the view still exists
    void post_to_view(std::function<void(View&)> fn);

    WeakViewRef view_;
    std::shared_ptr<Presenter> presenter_;
    Executor& delivery_;
    std::shared_ptr<DeliveryLoop> loop_;
};

} // namespace mvpbind
