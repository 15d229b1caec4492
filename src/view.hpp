#pragma once
#include "state.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <memory>
#include <optional>

namespace mvpbind {

// Arguments a view was created with (the host's launch extras)
using Arguments = nlohmann::json;

enum class MessageDuration { Short, Long };

// Request for the host environment to start another screen or action.
// A request_code asks for the result to be routed back.
struct HostAction {
    std::string name;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<int> request_code;
};

// Host environment a view lives in: message display and action launching.
class Host {
public:
    virtual ~Host() = default;
    virtual void show_message(const std::string& text, MessageDuration duration) = 0;
    virtual void start_action(const HostAction& action) = 0;
};

// A short-lived, lifecycle-bound consumer of presenter state.
// Owned by the UI side via shared_ptr; bindings only hold it weakly.
class View {
public:
    virtual ~View() = default;

    virtual void on_state_changed(const State& state) = 0;
    virtual void finish() = 0;

    virtual Arguments arguments() const { return Arguments::object(); }

    // nullptr when the view is not attached to a host
    virtual Host* host() { return nullptr; }

    virtual std::string view_name() const { return "View"; }
};

// Typed view helper: casts State& to the concrete state type. States are
// produced by the presenter the view is bound to, so the cast is static.
template<typename S>
class TypedView : public View {
public:
    void on_state_changed(const State& state) final {
        render(static_cast<const S&>(state));
    }

protected:
    virtual void render(const S& state) = 0;
};

// What a presenter sees of a connected view. Every call is non-blocking:
// view-bound work is posted to the delivery thread.
class ViewHandle {
public:
    virtual ~ViewHandle() = default;

    // Queue a snapshot for delivery
    virtual void post(StatePtr state) = 0;

    virtual void finish() = 0;
    virtual void show_message(const std::string& text, MessageDuration duration) = 0;
    virtual void start_host_action(HostAction action) = 0;

    // The bound view, or nullptr once it has been destroyed
    virtual std::shared_ptr<View> view() const = 0;

    // Empty object once the view has been destroyed
    virtual Arguments arguments() const = 0;

    // Disconnect from the presenter if the view was destroyed without an
    // explicit disconnect. Returns true only on the call that did so.
    virtual bool expunge_if_reclaimed() = 0;
};

} // namespace mvpbind
