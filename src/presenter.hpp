#pragma once
#include "executor.hpp"
#include "state.hpp"
#include "view.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mvpbind {

// What a presenter owner (Runtime) and a binding need from a presenter.
class Presenter {
public:
    virtual ~Presenter() = default;

    virtual void connect(std::shared_ptr<ViewHandle> handle) = 0;

    // Disconnecting an unknown or already disconnected handle is a no-op
    virtual void disconnect(const std::shared_ptr<ViewHandle>& handle) = 0;

    // True when no view is connected; the owner may then drop the presenter
    virtual bool is_detached() const = 0;

    virtual int id() const = 0;

    // Result of a HostAction started with a request_code
    virtual void deliver_action_result(const std::shared_ptr<ViewHandle>& handle,
                                       int request_code, int result_code,
                                       nlohmann::json data) = 0;

    // Ask every connected view to finish
    virtual void finish() = 0;
};

// Base for presenters: owns the mutable state and the set of connected views.
//
// Hooks, commits and execute() tasks run on the presenter's executor inside
// one recursive critical section, so a hook may commit. Snapshots therefore
// reach every view in commit order.
//
// Must be owned by a std::shared_ptr: connect()/disconnect()/execute() keep
// the presenter alive through shared_from_this() until their task has run.
class BasePresenter : public Presenter,
                      public std::enable_shared_from_this<BasePresenter> {
public:
    BasePresenter(Executor& executor, std::unique_ptr<State> state,
                  std::string name = "Presenter");

    void connect(std::shared_ptr<ViewHandle> handle) final;
    void disconnect(const std::shared_ptr<ViewHandle>& handle) final;
    bool is_detached() const final;
    int id() const final { return id_; }
    void deliver_action_result(const std::shared_ptr<ViewHandle>& handle,
                               int request_code, int result_code,
                               nlohmann::json data) final;
    void finish() override;

    size_t view_count() const;
    const std::string& name() const { return name_; }

    // Run a task on the presenter executor inside the critical section.
    // Exceptions are logged.
    void execute(std::function<void()> task);

    // {"id", "name", "views", "revision", "state"}
    nlohmann::json describe() const;

protected:
    // Broadcast a snapshot to every connected view if the state changed
    // (or was never committed). Call from the presenter executor.
    void commit();

    // Independent clone of the current state
    StatePtr snapshot() const;

    State& base_state() { return *state_; }
    const State& base_state() const { return *state_; }

    // Called for the first view only, before on_view_connected. Put state
    // initialization and subscriptions here.
    virtual void on_first_view_connected(ViewHandle& /*handle*/) {}
    virtual void on_view_connected(ViewHandle& /*handle*/) {}
    virtual void on_view_disconnected(ViewHandle& /*handle*/) {}
    // The presenter is about to be released by its owner
    virtual void on_last_view_disconnected() {}
    // Runs inside the critical section, like the connect hooks
    virtual void on_action_result(ViewHandle& /*handle*/, int /*request_code*/,
                                  int /*result_code*/, const nlohmann::json& /*data*/) {}

private:
    using HandleList = std::vector<std::shared_ptr<ViewHandle>>;

    std::shared_ptr<const HandleList> handles() const;
    void expunge_reclaimed();

    static std::atomic<int> last_id_;

    const int id_;
    const std::string name_;
    Executor& executor_;
    std::unique_ptr<State> state_;

    // Guards hooks, commits and execute() tasks
    mutable std::recursive_mutex section_;

    // Serializes writers; readers load the list atomically
    std::mutex registry_mutex_;
    std::shared_ptr<const HandleList> handles_;

    std::atomic<bool> expunging_{false};
};

// Presenter over a concrete state type S (derived from StateBase<S>).
template<typename S>
class StatePresenter : public BasePresenter {
public:
    explicit StatePresenter(Executor& executor, S initial = S{},
                            std::string name = "Presenter")
        : BasePresenter(executor, std::make_unique<S>(std::move(initial)), std::move(name))
    {}

    // Mutate the state on the presenter executor, then commit
    void update(std::function<void(S&)> mutator) {
        execute([this, mutator = std::move(mutator)]() {
            mutator(state());
            commit();
        });
    }

protected:
    S& state() { return static_cast<S&>(base_state()); }
    const S& state() const { return static_cast<const S&>(base_state()); }
};

} // namespace mvpbind
