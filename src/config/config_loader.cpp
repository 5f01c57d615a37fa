#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "server/listen_address.hpp"
#include "shutdown/posix_signal_source.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace streamgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.address = s["address"].value_or(cfg.address);
    cfg.max_connections = s["max_connections"].value_or(cfg.max_connections);
    return cfg;
}

ShutdownConfig ConfigLoader::extract_shutdown(const toml::table& root) {
    ShutdownConfig cfg;
    const auto* shutdown = root["shutdown"].as_table();
    if (!shutdown) return cfg;
    const auto& s = *shutdown;

    // Integer milliseconds, or the string "infinite"
    const auto grace = s["grace_period_ms"];
    if (grace) {
        if (grace.is_integer()) {
            cfg.grace_period_ms = grace.as_integer()->get();
        } else if (grace.is_string() && utils::to_lower(grace.as_string()->get()) == "infinite") {
            cfg.grace_period_ms = std::nullopt;
        } else {
            throw std::runtime_error(
                "shutdown.grace_period_ms must be an integer or the string \"infinite\"");
        }
    }

    cfg.forced_exit_code = s["forced_exit_code"].value_or(cfg.forced_exit_code);
    if (s.contains("signals")) {
        cfg.signals = toml_string_array(s, "signals");
    }
    return cfg;
}

HealthConfig ConfigLoader::extract_health(const toml::table& root) {
    HealthConfig cfg;
    const auto* health = root["health"].as_table();
    if (!health) return cfg;
    const auto& h = *health;

    cfg.enabled = h["enabled"].value_or(true);
    cfg.address = h["address"].value_or(cfg.address);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

StreamgateConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    StreamgateConfig config;
    config.server = extract_server(root);
    config.shutdown = extract_shutdown(root);
    config.health = extract_health(root);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(StreamgateConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const StreamgateConfig& config) {
    std::vector<std::string> errors;

    try {
        (void)ListenAddress::parse(config.server.address);
    } catch (const std::invalid_argument& e) {
        errors.push_back(std::format("server.address: {}", e.what()));
    }

    if (config.server.max_connections <= 0 ||
        config.server.max_connections > std::numeric_limits<uint32_t>::max()) {
        errors.push_back(std::format("server.max_connections must be 1-{}, got {}",
            std::numeric_limits<uint32_t>::max(), config.server.max_connections));
    }

    if (config.shutdown.grace_period_ms && *config.shutdown.grace_period_ms < 0) {
        errors.push_back(std::format("shutdown.grace_period_ms must be >= 0, got {}",
                                     *config.shutdown.grace_period_ms));
    }

    if (config.shutdown.forced_exit_code < 0 || config.shutdown.forced_exit_code > 255) {
        errors.push_back(std::format("shutdown.forced_exit_code must be 0-255, got {}",
                                     config.shutdown.forced_exit_code));
    }

    if (config.shutdown.signals.empty()) {
        errors.push_back("shutdown.signals must list at least one signal");
    }
    for (const auto& name : config.shutdown.signals) {
        try {
            (void)signal_from_name(name);
        } catch (const std::invalid_argument& e) {
            errors.push_back(std::format("shutdown.signals: {}", e.what()));
        }
    }

    if (config.health.enabled) {
        try {
            (void)ListenAddress::parse(config.health.address);
        } catch (const std::invalid_argument& e) {
            errors.push_back(std::format("health.address: {}", e.what()));
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace streamgate
