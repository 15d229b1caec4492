#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace mvpbind {

nlohmann::json Config::defaults_json() {
    return {
        {"thinning_factor", 8},
        {"presenter_threads", 2}
    };
}

// Fill keys missing from the file with their defaults
static nlohmann::json merge_defaults(nlohmann::json merged, const nlohmann::json& defaults) {
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) merged[key] = value;
    }
    return merged;
}

// Positive integer field; missing, non-integer or out of range keeps target
static void read_positive(const nlohmann::json& j, const char* key, uint32_t& target) {
    if (!j.contains(key) || !j[key].is_number_integer()) return;
    auto v = j[key].get<int64_t>();
    if (v > 0 && v <= static_cast<int64_t>(UINT32_MAX)) {
        target = static_cast<uint32_t>(v);
    }
}

// Positive integer from an env var; anything else leaves target untouched
static void apply_env_uint(const char* name, uint32_t& target) {
    const char* v = std::getenv(name);
    if (!v) return;
    try {
        unsigned long parsed = std::stoul(v);
        if (parsed == 0 || parsed > UINT32_MAX) {
            std::cerr << "[config] Ignoring out of range " << name << "=" << v << "\n";
            return;
        }
        target = static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring non-numeric " << name << "=" << v << "\n";
    }
}

Config Config::load(const std::string& path) {
    nlohmann::json j = defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json parsed = nlohmann::json::parse(file);
            if (parsed.is_object()) {
                j = merge_defaults(parsed, defaults_json());
            } else {
                std::cerr << "[config] " << path << " is not a JSON object, using defaults\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << path << ": " << e.what()
                      << ", using defaults\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override the config file
    apply_env_uint("MVPBIND_THINNING_FACTOR", cfg.thinning_factor);
    apply_env_uint("MVPBIND_PRESENTER_THREADS", cfg.presenter_threads);

    return cfg;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_positive(j, "thinning_factor", cfg.thinning_factor);
    read_positive(j, "presenter_threads", cfg.presenter_threads);
    return cfg;
}

nlohmann::json Config::to_json() const {
    return {
        {"thinning_factor", thinning_factor},
        {"presenter_threads", presenter_threads}
    };
}

} // namespace mvpbind
