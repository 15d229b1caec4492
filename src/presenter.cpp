#include "presenter.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace mvpbind {

std::atomic<int> BasePresenter::last_id_{0};

BasePresenter::BasePresenter(Executor& executor, std::unique_ptr<State> state,
                             std::string name)
    : id_(++last_id_)
    , name_(std::move(name))
    , executor_(executor)
    , state_(std::move(state))
    , handles_(std::make_shared<const HandleList>())
{
    if (!state_) {
        throw std::invalid_argument("Presenter " + name_ + " requires a state");
    }
}

void BasePresenter::connect(std::shared_ptr<ViewHandle> handle) {
    if (!handle) return;

    bool is_first = false;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto current = handles();
        if (std::find(current->begin(), current->end(), handle) != current->end()) {
            std::cerr << "[presenter] " << name_ << "#" << id_
                      << ": view already connected, ignored\n";
            return;
        }
        is_first = current->empty();
        auto next = std::make_shared<HandleList>(*current);
        next->push_back(handle);
        std::atomic_store(&handles_, std::shared_ptr<const HandleList>(std::move(next)));
    }

    auto self = shared_from_this();
    executor_.execute([self, handle, is_first]() {
        std::lock_guard<std::recursive_mutex> section(self->section_);
        try {
            if (is_first) {
                self->on_first_view_connected(*handle);
            }
            self->on_view_connected(*handle);
        } catch (const std::exception& e) {
            std::cerr << "[presenter] " << self->name_ << "#" << self->id_
                      << ": connect hook failed: " << e.what() << "\n";
        }
        // Still inside the section: no later commit can overtake this snapshot
        handle->post(self->snapshot());
    });

    expunge_reclaimed();
}

void BasePresenter::disconnect(const std::shared_ptr<ViewHandle>& handle) {
    if (!handle) return;

    bool is_last = false;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto current = handles();
        auto it = std::find(current->begin(), current->end(), handle);
        if (it == current->end()) return;
        auto next = std::make_shared<HandleList>();
        next->reserve(current->size() - 1);
        for (const auto& h : *current) {
            if (h != handle) next->push_back(h);
        }
        is_last = next->empty();
        std::atomic_store(&handles_, std::shared_ptr<const HandleList>(std::move(next)));
    }

    auto self = shared_from_this();
    executor_.execute([self, handle, is_last]() {
        std::lock_guard<std::recursive_mutex> section(self->section_);
        try {
            self->on_view_disconnected(*handle);
            if (is_last) {
                self->on_last_view_disconnected();
            }
        } catch (const std::exception& e) {
            std::cerr << "[presenter] " << self->name_ << "#" << self->id_
                      << ": disconnect hook failed: " << e.what() << "\n";
        }
    });

    expunge_reclaimed();
}

void BasePresenter::deliver_action_result(const std::shared_ptr<ViewHandle>& handle,
                                          int request_code, int result_code,
                                          nlohmann::json data) {
    if (!handle) return;
    auto current = handles();
    if (std::find(current->begin(), current->end(), handle) == current->end()) {
        std::cerr << "[presenter] " << name_ << "#" << id_ << ": result for request "
                  << request_code << " from a disconnected view, dropped\n";
        return;
    }
    auto self = shared_from_this();
    execute([self, handle, request_code, result_code, data = std::move(data)]() {
        self->on_action_result(*handle, request_code, result_code, data);
    });
}

bool BasePresenter::is_detached() const {
    return handles()->empty();
}

void BasePresenter::finish() {
    auto current = handles();
    for (const auto& handle : *current) {
        handle->finish();
    }
}

size_t BasePresenter::view_count() const {
    return handles()->size();
}

void BasePresenter::execute(std::function<void()> task) {
    auto self = shared_from_this();
    executor_.execute([self, task = std::move(task)]() {
        std::lock_guard<std::recursive_mutex> section(self->section_);
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[presenter] " << self->name_ << "#" << self->id_
                      << ": task failed: " << e.what() << "\n";
        }
    });
}

nlohmann::json BasePresenter::describe() const {
    std::lock_guard<std::recursive_mutex> section(section_);
    return {
        {"id", id_},
        {"name", name_},
        {"views", view_count()},
        {"revision", state_->revision()},
        {"state", state_->to_json()}
    };
}

void BasePresenter::commit() {
    std::lock_guard<std::recursive_mutex> section(section_);
    if (!state_->is_changed() && !state_->is_initial()) return;

    auto targets = handles();
    state_->advance_revision();
    auto committed = snapshot();
    state_->clear_changed();
    for (const auto& handle : *targets) {
        handle->post(committed->clone());
    }
}

StatePtr BasePresenter::snapshot() const {
    return state_->clone();
}

std::shared_ptr<const BasePresenter::HandleList> BasePresenter::handles() const {
    return std::atomic_load(&handles_);
}

// Backstop for views destroyed without disconnect(). One sweep at a time:
// a sweep disconnects reclaimed handles, and those disconnects must not
// start sweeps of their own while a reference lock is held.
void BasePresenter::expunge_reclaimed() {
    bool expected = false;
    if (!expunging_.compare_exchange_strong(expected, true)) return;
    // Disconnects below swap the list; keep this one alive while iterating
    auto current = handles();
    for (const auto& handle : *current) {
        handle->expunge_if_reclaimed();
    }
    expunging_.store(false);
}

} // namespace mvpbind
