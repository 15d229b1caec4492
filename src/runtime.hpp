#pragma once
#include "config.hpp"
#include "executor.hpp"
#include "presenter.hpp"
#include "view_binding.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mvpbind {

// Owns the delivery thread, the presenter lanes and the long-lived
// presenters. Views come and go; a presenter stays in the table, found by
// id, until release_detached() sees it has no views left.
//
// Presenters and bindings handed out by a Runtime refer to its executors,
// so they must be dropped before the Runtime is destroyed. Call shutdown()
// (or let the destructor run) only after callers released them.
class Runtime {
public:
    explicit Runtime(const Config& config);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Constructs P(lane_executor, args...). Presenters are spread over the
    // lanes round-robin; each presenter stays on one lane.
    template<typename P, typename... Args>
    std::shared_ptr<P> create_presenter(Args&&... args) {
        auto presenter = std::make_shared<P>(next_lane(), std::forward<Args>(args)...);
        add_presenter(presenter);
        return presenter;
    }

    // nullptr when unknown or already released
    std::shared_ptr<BasePresenter> find_presenter(int id) const;

    std::vector<int> list_presenters() const;

    // Create a binding for view and connect it to presenter
    std::shared_ptr<ViewBinding> bind(const std::shared_ptr<View>& view,
                                      std::shared_ptr<Presenter> presenter);

    // Drop presenters without connected views. Returns how many were dropped.
    size_t release_detached();

    // Wait for work already queued on the lanes, then on the delivery thread.
    // Must not be called from one of the runtime's own threads.
    void flush();

    // Stop the presenter lanes, then the delivery thread. Queued tasks run first.
    void shutdown();

    SerialExecutor& delivery_executor() { return *delivery_; }
    const Config& config() const { return config_; }

private:
    Executor& next_lane();
    void add_presenter(std::shared_ptr<BasePresenter> presenter);

    Config config_;
    std::unique_ptr<SerialExecutor> delivery_;
    std::vector<std::unique_ptr<SerialExecutor>> lanes_;
    size_t next_lane_ = 0;

    mutable std::mutex mutex_;
    std::unordered_map<int, std::shared_ptr<BasePresenter>> presenters_;
};

} // namespace mvpbind
