#include "runtime.hpp"

#include <iostream>
#include <stdexcept>

namespace mvpbind {

Runtime::Runtime(const Config& config)
    : config_(config)
{
    if (config_.thinning_factor == 0) {
        throw std::invalid_argument("Runtime requires thinning_factor >= 1");
    }
    if (config_.presenter_threads == 0) {
        throw std::invalid_argument("Runtime requires presenter_threads >= 1");
    }
    delivery_ = std::make_unique<SerialExecutor>("delivery");
    lanes_.reserve(config_.presenter_threads);
    for (uint32_t i = 0; i < config_.presenter_threads; ++i) {
        lanes_.push_back(std::make_unique<SerialExecutor>("presenter-" + std::to_string(i)));
    }
}

Runtime::~Runtime() {
    shutdown();
}

std::shared_ptr<BasePresenter> Runtime::find_presenter(int id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = presenters_.find(id);
    if (it == presenters_.end()) return nullptr;
    return it->second;
}

std::vector<int> Runtime::list_presenters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> ids;
    ids.reserve(presenters_.size());
    for (const auto& [id, _] : presenters_) {
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<ViewBinding> Runtime::bind(const std::shared_ptr<View>& view,
                                           std::shared_ptr<Presenter> presenter) {
    auto binding = ViewBinding::create(view, std::move(presenter), *delivery_,
                                       config_.thinning_factor);
    binding->connect();
    return binding;
}

size_t Runtime::release_detached() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t released = 0;
    for (auto it = presenters_.begin(); it != presenters_.end(); ) {
        if (it->second->is_detached()) {
            std::cerr << "[runtime] Releasing detached presenter "
                      << it->second->name() << "#" << it->first << "\n";
            it = presenters_.erase(it);
            ++released;
        } else {
            ++it;
        }
    }
    return released;
}

void Runtime::flush() {
    for (auto& lane : lanes_) {
        lane->flush();
    }
    delivery_->flush();
}

void Runtime::shutdown() {
    // Lanes first: their hooks and commits post into the delivery queue
    for (auto& lane : lanes_) {
        lane->shutdown();
    }
    if (delivery_) delivery_->shutdown();
}

Executor& Runtime::next_lane() {
    std::lock_guard<std::mutex> lock(mutex_);
    Executor& lane = *lanes_[next_lane_];
    next_lane_ = (next_lane_ + 1) % lanes_.size();
    return lane;
}

void Runtime::add_presenter(std::shared_ptr<BasePresenter> presenter) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = presenter->id();
    presenters_.emplace(id, std::move(presenter));
}

} // namespace mvpbind
