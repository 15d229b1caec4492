#include "view_binding.hpp"

#include <iostream>
#include <stdexcept>

namespace mvpbind {

std::shared_ptr<ViewBinding> ViewBinding::create(const std::shared_ptr<View>& view,
                                                 std::shared_ptr<Presenter> presenter,
                                                 Executor& delivery,
                                                 size_t thinning_factor) {
    if (!view) throw std::invalid_argument("ViewBinding requires a view");
    if (!presenter) throw std::invalid_argument("ViewBinding requires a presenter");

    auto binding = std::make_shared<ViewBinding>(Key{}, view, std::move(presenter), delivery);

    std::weak_ptr<View> weak_view = view;
    std::weak_ptr<ViewBinding> weak_binding = binding;
    binding->loop_ = DeliveryLoop::create(
        delivery,
        [weak_view](const State& state) {
            // A destroyed view simply misses the snapshot
            if (auto v = weak_view.lock()) v->on_state_changed(state);
        },
        thinning_factor,
        [weak_binding]() {
            if (auto b = weak_binding.lock()) b->expunge_if_reclaimed();
        });
    return binding;
}

ViewBinding::ViewBinding(Key, const std::shared_ptr<View>& view,
                         std::shared_ptr<Presenter> presenter,
                         Executor& delivery)
    : view_(view)
    , presenter_(std::move(presenter))
    , delivery_(delivery)
{}

void ViewBinding::post(StatePtr state) {
    loop_->post(std::move(state));
    expunge_if_reclaimed();
}

void ViewBinding::finish() {
    post_to_view([](View& view) { view.finish(); });
}

void ViewBinding::show_message(const std::string& text, MessageDuration duration) {
    post_to_view([text, duration](View& view) {
        if (Host* host = view.host()) host->show_message(text, duration);
    });
}

void ViewBinding::start_host_action(HostAction action) {
    post_to_view([action = std::move(action)](View& view) {
        if (Host* host = view.host()) host->start_action(action);
    });
}

std::shared_ptr<View> ViewBinding::view() const {
    return view_.lock();
}

Arguments ViewBinding::arguments() const {
    auto v = view_.lock();
    return v ? v->arguments() : Arguments::object();
}

bool ViewBinding::expunge_if_reclaimed() {
    return view_.expunge_if_reclaimed([this]() {
        std::cerr << "[delivery] View destroyed without disconnect, disconnecting from presenter #"
                  << presenter_->id() << "\n";
        presenter_->disconnect(shared_from_this());
    });
}

void ViewBinding::connect() {
    presenter_->connect(shared_from_this());
}

void ViewBinding::disconnect() {
    presenter_->disconnect(shared_from_this());
}

void ViewBinding::set_enabled(bool value) {
    loop_->set_enabled(value);
}

void ViewBinding::on_resumed() {
    loop_->on_resumed();
}

void ViewBinding::on_paused() {
    loop_->on_paused();
}

void ViewBinding::deliver_action_result(int request_code, int result_code,
                                        nlohmann::json data) {
    presenter_->deliver_action_result(shared_from_this(), request_code, result_code,
                                      std::move(data));
}

void ViewBinding::post_to_view(std::function<void(View&)> fn) {
    std::weak_ptr<ViewBinding> weak = shared_from_this();
    delivery_.execute([weak, fn = std::move(fn)]() {
        auto self = weak.lock();
        if (!self) return;
        if (auto v = self->view()) {
            try {
                fn(*v);
            } catch (const std::exception& e) {
                std::cerr << "[delivery] " << v->view_name() << ": view action failed: "
                          << e.what() << "\n";
            }
        }
        self->expunge_if_reclaimed();
    });
}

} // namespace mvpbind
