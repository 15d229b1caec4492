#pragma once
#include <nlohmann/json.hpp>
#include <memory>
#include <cstdint>

namespace mvpbind {

// Presenter state. The presenter owns one mutable instance; views only ever
// see clones of it (snapshots), so a snapshot is never mutated after posting.
class State {
public:
    virtual ~State() = default;

    virtual std::unique_ptr<State> clone() const = 0;

    // Diagnostic description, used by Presenter::describe()
    virtual nlohmann::json to_json() const { return nlohmann::json::object(); }

    bool is_changed() const { return changed_; }
    bool is_initial() const { return initial_; }
    uint64_t revision() const { return revision_; }

    void set_changed() { changed_ = true; }

    // Called by commit before the snapshot is taken, so one revision
    // always names one committed content.
    void advance_revision() { ++revision_; }

    // Called by commit after the snapshot is taken
    void clear_changed() {
        changed_ = false;
        initial_ = false;
    }

protected:
    State() = default;
    State(const State&) = default;
    State& operator=(const State&) = default;

private:
    bool changed_ = false;
    bool initial_ = true;
    uint64_t revision_ = 0;
};

using StatePtr = std::shared_ptr<const State>;

// CRTP helper: derive concrete states from StateBase<MyState> to get clone().
template<typename S>
class StateBase : public State {
public:
    std::unique_ptr<State> clone() const override {
        return std::make_unique<S>(static_cast<const S&>(*this));
    }
};

} // namespace mvpbind
