#include <catch2/catch.hpp>
#include "runtime.hpp"
#include "mock_view.hpp"
#include <algorithm>

using namespace mvpbind;

static Config small_config() {
    Config cfg;
    cfg.presenter_threads = 2;
    cfg.thinning_factor = 8;
    return cfg;
}

TEST_CASE("Runtime: rejects zero-sized configs", "[runtime]") {
    Config cfg;
    cfg.presenter_threads = 0;
    REQUIRE_THROWS_AS(Runtime(cfg), std::invalid_argument);

    cfg = Config{};
    cfg.thinning_factor = 0;
    REQUIRE_THROWS_AS(Runtime(cfg), std::invalid_argument);
}

TEST_CASE("Runtime: create_presenter registers by id", "[runtime]") {
    Runtime runtime(small_config());
    auto a = runtime.create_presenter<TestPresenter>();
    auto b = runtime.create_presenter<TestPresenter>();

    REQUIRE(runtime.find_presenter(a->id()) == a);
    REQUIRE(runtime.find_presenter(b->id()) == b);
    REQUIRE(runtime.find_presenter(-1) == nullptr);

    auto ids = runtime.list_presenters();
    REQUIRE(ids.size() == 2);
    REQUIRE(std::find(ids.begin(), ids.end(), a->id()) != ids.end());
}

TEST_CASE("Runtime: bind connects and delivers the initial snapshot", "[runtime]") {
    Runtime runtime(small_config());
    EventLog log;
    auto presenter = runtime.create_presenter<TestPresenter>(&log);
    presenter->first_value = 11;

    auto view = std::make_shared<RecordingView>("A", &log);
    auto binding = runtime.bind(view, presenter);
    binding->set_enabled(true);
    binding->on_resumed();
    runtime.flush();
    runtime.flush();

    REQUIRE(view->values() == std::vector<int>{11});
    REQUIRE(log.count("first:A") == 1);

    binding->disconnect();
    runtime.flush();
    REQUIRE(log.count("last") == 1);
}

TEST_CASE("Runtime: rapid updates end on the newest value", "[runtime]") {
    Runtime runtime(small_config());
    auto presenter = runtime.create_presenter<TestPresenter>();
    auto view = std::make_shared<RecordingView>("A");
    auto binding = runtime.bind(view, presenter);
    binding->set_enabled(true);
    binding->on_resumed();

    for (int i = 1; i <= 200; i++) presenter->set_value(i);
    runtime.flush();
    runtime.flush();

    auto values = view->values();
    REQUIRE(!values.empty());
    REQUIRE(values.back() == 200);
    REQUIRE_FALSE(view->overlapped);
    for (size_t i = 1; i < values.size(); i++) {
        REQUIRE(values[i - 1] <= values[i]);
    }

    binding->disconnect();
    runtime.flush();
}

TEST_CASE("Runtime: release_detached drops presenters without views", "[runtime]") {
    Runtime runtime(small_config());
    auto kept = runtime.create_presenter<TestPresenter>();
    auto dropped = runtime.create_presenter<TestPresenter>();

    auto view = std::make_shared<RecordingView>("A");
    auto binding = runtime.bind(view, kept);
    runtime.flush();

    REQUIRE(runtime.release_detached() == 1);
    REQUIRE(runtime.find_presenter(dropped->id()) == nullptr);
    REQUIRE(runtime.find_presenter(kept->id()) == kept);

    binding->disconnect();
    runtime.flush();
    REQUIRE(runtime.release_detached() == 1);
    REQUIRE(runtime.list_presenters().empty());
}

TEST_CASE("Runtime: presenter survives view recreation", "[runtime]") {
    Runtime runtime(small_config());
    EventLog log;
    auto presenter = runtime.create_presenter<TestPresenter>(&log);
    int id = presenter->id();

    auto first = std::make_shared<RecordingView>("A", &log);
    auto first_binding = runtime.bind(first, presenter);
    first_binding->set_enabled(true);
    first_binding->on_resumed();
    runtime.flush();
    presenter->set_value(5);
    runtime.flush();
    runtime.flush();

    // Replacement view binds before the old one goes away
    auto found = runtime.find_presenter(id);
    REQUIRE(found == presenter);
    auto second = std::make_shared<RecordingView>("B", &log);
    auto second_binding = runtime.bind(second, found);
    second_binding->set_enabled(true);
    second_binding->on_resumed();
    first_binding->disconnect();
    runtime.flush();
    runtime.flush();

    REQUIRE(second->values() == std::vector<int>{5});
    REQUIRE(log.count("first:A") == 1);
    REQUIRE(log.count("last") == 0);
    REQUIRE(runtime.release_detached() == 0);

    second_binding->disconnect();
    runtime.flush();
}

TEST_CASE("Runtime: handed-out objects are released before teardown", "[runtime]") {
    EventLog log;
    std::weak_ptr<TestPresenter> weak_presenter;
    std::weak_ptr<ViewBinding> weak_binding;
    {
        Runtime runtime(small_config());
        auto presenter = runtime.create_presenter<TestPresenter>(&log);
        auto view = std::make_shared<RecordingView>("A", &log);
        auto binding = runtime.bind(view, presenter);
        weak_presenter = presenter;
        weak_binding = binding;
        runtime.flush();

        binding->disconnect();
        runtime.flush();
        REQUIRE(runtime.release_detached() == 1);

        binding.reset();
        presenter.reset();
        runtime.flush();
        REQUIRE(weak_binding.expired());
        REQUIRE(weak_presenter.expired());
    }
    REQUIRE(log.count("last") == 1);
}

TEST_CASE("Runtime: shutdown is idempotent", "[runtime]") {
    Runtime runtime(small_config());
    runtime.shutdown();
    REQUIRE_NOTHROW(runtime.shutdown());
}
