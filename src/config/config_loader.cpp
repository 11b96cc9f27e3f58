#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>

using namespace std::string_literals;

namespace tablegate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
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

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (auto* s = val.as_string()) {
            *s = expand_env_vars(s->get());
        } else if (auto* sub = val.as_table()) {
            expand_env_vars_recursive(*sub);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto tbl = toml::parse(content);
    expand_env_vars_recursive(tbl);
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Section Extraction
// ============================================================================

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.default_schema = d["default_schema"].value_or(cfg.default_schema);
    cfg.policy_schema = d["policy_schema"].value_or(cfg.policy_schema);
    cfg.policy_table = d["policy_table"].value_or(cfg.policy_table);
    cfg.policy_file = d["policy_file"].value_or(""s);

    const std::string source = utils::to_lower(d["policy_source"].value_or("database"s));
    if (source == "database") {
        cfg.policy_source = PolicySource::DATABASE;
    } else if (source == "file") {
        cfg.policy_source = PolicySource::FILE;
    } else {
        throw std::runtime_error(std::format(
            "database.policy_source must be \"database\" or \"file\", got \"{}\"", source));
    }

    const int64_t timeout = d["statement_timeout_ms"].value_or(int64_t{0});
    if (timeout < 0 || timeout > UINT32_MAX) {
        throw std::runtime_error(std::format(
            "database.statement_timeout_ms out of range: {}", timeout));
    }
    cfg.statement_timeout_ms = static_cast<uint32_t>(timeout);
    return cfg;
}

AuthConfig ConfigLoader::extract_auth(const toml::table& root) {
    AuthConfig cfg;
    const auto* auth = root["auth"].as_table();
    if (!auth) return cfg;
    const auto& a = *auth;

    cfg.issuer = a["issuer"].value_or(cfg.issuer);
    cfg.audience = a["audience"].value_or(cfg.audience);
    cfg.secret = a["secret"].value_or(""s);
    cfg.token_ttl_seconds = a["token_ttl_seconds"].value_or(cfg.token_ttl_seconds);
    cfg.clock_skew_ms = a["clock_skew_ms"].value_or(cfg.clock_skew_ms);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

EngineConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    EngineConfig config;
    config.database = extract_database(tbl);
    config.auth = extract_auth(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config) {
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
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto result = load_from_string(content);
    if (!result.success) {
        return LoadResult::error(std::format("{}: {}", config_path, result.error_message));
    }

    auto& policy_file = result.config.database.policy_file;
    if (!policy_file.empty() && std::filesystem::path(policy_file).is_relative()) {
        const auto base_dir = std::filesystem::path(config_path).parent_path();
        policy_file = (base_dir / policy_file).string();
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::runtime_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    const auto& db = config.database;
    if (!utils::is_simple_identifier(db.default_schema)) {
        errors.push_back(std::format("database.default_schema is not a valid identifier: \"{}\"",
                                     db.default_schema));
    }
    if (!utils::is_simple_identifier(db.policy_schema)) {
        errors.push_back(std::format("database.policy_schema is not a valid identifier: \"{}\"",
                                     db.policy_schema));
    }
    if (!utils::is_simple_identifier(db.policy_table)) {
        errors.push_back(std::format("database.policy_table is not a valid identifier: \"{}\"",
                                     db.policy_table));
    }
    if (db.policy_source == PolicySource::FILE && db.policy_file.empty()) {
        errors.push_back("database.policy_file required when policy_source is \"file\"");
    }

    const auto& auth = config.auth;
    if (auth.secret.empty()) {
        errors.push_back("auth.secret must not be empty");
    }
    if (auth.token_ttl_seconds <= 0) {
        errors.push_back(std::format("auth.token_ttl_seconds must be > 0, got {}",
                                     auth.token_ttl_seconds));
    }
    if (auth.clock_skew_ms < 0) {
        errors.push_back(std::format("auth.clock_skew_ms must be >= 0, got {}", auth.clock_skew_ms));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got \"{}\"",
                                     config.logging.level));
    }

    return errors;
}

} // namespace tablegate
