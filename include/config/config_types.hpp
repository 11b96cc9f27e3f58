#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tablegate {

// ============================================================================
// Database Config
// ============================================================================

enum class PolicySource : uint8_t {
    DATABASE,   // Registry table, read per request
    FILE        // TOML policy file, loaded once into memory
};

[[nodiscard]] inline constexpr std::string_view policy_source_to_string(PolicySource s) {
    return s == PolicySource::DATABASE ? "database" : "file";
}

struct DatabaseConfig {
    std::string connection_string;
    std::string default_schema = "public";
    std::string policy_schema = "public";
    std::string policy_table = "_policies";
    PolicySource policy_source = PolicySource::DATABASE;
    std::string policy_file;
    uint32_t statement_timeout_ms = 0;
};

// ============================================================================
// Auth Config
// ============================================================================

struct AuthConfig {
    std::string issuer = "tablegate";
    std::string audience = "tablegate-clients";
    std::string secret;
    int64_t token_ttl_seconds = 3600;
    int64_t clock_skew_ms = 250;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// EngineConfig - Complete parsed configuration
// ============================================================================

struct EngineConfig {
    DatabaseConfig database;
    AuthConfig auth;
    LoggingConfig logging;
};

} // namespace tablegate
