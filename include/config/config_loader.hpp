#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief Loads tablegate.toml into EngineConfig
 *
 * ${VAR} patterns in string values are expanded from the environment
 * (unset variables expand to nothing, an unclosed pattern is an error).
 * A relative policy_file resolves against the config file's directory.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
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
     * @param config_path Path to tablegate.toml
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
     * @brief Check a parsed config
     * @return One message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

private:
    static DatabaseConfig extract_database(const toml::table& root);
    static AuthConfig extract_auth(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static EngineConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(EngineConfig config);
};

} // namespace tablegate
