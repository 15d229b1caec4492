#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mvpbind {

struct Config {
    uint32_t thinning_factor = 8;    // backlog / factor = sampling stride
    uint32_t presenter_threads = 2;  // serial presenter lanes

    // Load a JSON config file merged over defaults, then apply env vars
    // (MVPBIND_THINNING_FACTOR, MVPBIND_PRESENTER_THREADS). A missing file
    // means defaults; a malformed one is reported and ignored.
    static Config load(const std::string& path);

    // Parse an already merged JSON object. Invalid values keep defaults.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    nlohmann::json to_json() const;
};

} // namespace mvpbind
