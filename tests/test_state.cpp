#include <catch2/catch.hpp>
#include "state.hpp"
#include "mock_view.hpp"

using namespace mvpbind;

TEST_CASE("State: fresh state is initial and unchanged", "[state]") {
    CounterState s;
    REQUIRE(s.is_initial());
    REQUIRE_FALSE(s.is_changed());
    REQUIRE(s.revision() == 0);
}

TEST_CASE("State: clear_changed ends the initial phase", "[state]") {
    CounterState s;
    s.set_changed();
    REQUIRE(s.is_changed());

    s.clear_changed();
    REQUIRE_FALSE(s.is_changed());
    REQUIRE_FALSE(s.is_initial());
    REQUIRE(s.revision() == 0);
}

TEST_CASE("State: advance_revision leaves the flags alone", "[state]") {
    CounterState s;
    s.set_changed();
    s.advance_revision();
    REQUIRE(s.revision() == 1);
    REQUIRE(s.is_changed());
    REQUIRE(s.is_initial());
}

TEST_CASE("State: clone is an independent copy", "[state]") {
    CounterState s;
    s.value = 3;
    s.set_changed();

    auto copy = s.clone();
    s.value = 4;
    s.clear_changed();

    const auto& c = static_cast<const CounterState&>(*copy);
    REQUIRE(c.value == 3);
    REQUIRE(c.is_changed());
    REQUIRE(c.revision() == 0);
}

TEST_CASE("State: to_json describes the state", "[state]") {
    CounterState s;
    s.value = 12;
    REQUIRE(s.to_json()["value"] == 12);
}
