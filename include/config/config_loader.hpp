#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace streamgate {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        StreamgateConfig config;

        static LoadResult ok(StreamgateConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to streamgate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a config for semantic errors
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const StreamgateConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static ShutdownConfig extract_shutdown(const toml::table& root);
    static HealthConfig extract_health(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static StreamgateConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(StreamgateConfig config);
};

} // namespace streamgate
