#include <catch2/catch.hpp>
#include "executor.hpp"
#include <atomic>
#include <future>
#include <vector>

using namespace mvpbind;

TEST_CASE("SerialExecutor: runs tasks in submission order", "[executor]") {
    SerialExecutor executor("order");
    std::vector<int> order;
    for (int i = 0; i < 100; i++) {
        executor.execute([&order, i]() { order.push_back(i); });
    }
    executor.flush();

    REQUIRE(order.size() == 100);
    for (int i = 0; i < 100; i++) REQUIRE(order[i] == i);
}

TEST_CASE("SerialExecutor: tasks run on the worker thread", "[executor]") {
    SerialExecutor executor("worker");
    REQUIRE_FALSE(executor.is_worker_thread());

    bool on_worker = false;
    executor.execute([&]() { on_worker = executor.is_worker_thread(); });
    executor.flush();
    REQUIRE(on_worker);
}

TEST_CASE("SerialExecutor: failing task does not stop the worker", "[executor]") {
    SerialExecutor executor("faults");
    bool ran = false;
    executor.execute([]() { throw std::runtime_error("boom"); });
    executor.execute([&]() { ran = true; });
    executor.flush();
    REQUIRE(ran);
}

TEST_CASE("SerialExecutor: flush from the worker is rejected", "[executor]") {
    SerialExecutor executor("reentrant");
    std::promise<bool> threw;
    auto result = threw.get_future();
    executor.execute([&]() {
        try {
            executor.flush();
            threw.set_value(false);
        } catch (const std::logic_error&) {
            threw.set_value(true);
        }
    });
    REQUIRE(result.get());
}

TEST_CASE("SerialExecutor: shutdown runs queued tasks first", "[executor]") {
    std::atomic<int> count{0};
    SerialExecutor executor("shutdown");
    std::promise<void> gate;
    auto opened = gate.get_future().share();

    executor.execute([opened]() { opened.wait(); });
    for (int i = 0; i < 10; i++) executor.execute([&]() { count++; });
    REQUIRE(executor.pending() >= 10);

    gate.set_value();
    executor.shutdown();
    REQUIRE(count == 10);
    REQUIRE(executor.pending() == 0);
}

TEST_CASE("SerialExecutor: tasks after shutdown are dropped", "[executor]") {
    SerialExecutor executor("closed");
    executor.shutdown();

    bool ran = false;
    executor.execute([&]() { ran = true; });
    executor.flush();
    REQUIRE_FALSE(ran);
    REQUIRE(executor.pending() == 0);
    REQUIRE(executor.name() == "closed");
}

TEST_CASE("SerialExecutor: shutdown is idempotent", "[executor]") {
    SerialExecutor executor("twice");
    executor.shutdown();
    REQUIRE_NOTHROW(executor.shutdown());
}
