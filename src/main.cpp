#include "auth/claims_service.hpp"
#include "catalog/descriptor_parser.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_catalog_reader.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_policy_store.hpp"
#include "engine/table_access_engine.hpp"
#include "mapper/value_mapper.hpp"
#include "policy/policy_loader.hpp"
#include "policy/policy_store.hpp"

#include <cstring>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace tablegate;

namespace {

void print_usage() {
    std::cerr <<
        "usage: tablegate [-c <config>] <command> [args...]\n"
        "\n"
        "commands:\n"
        "  describe <table>                                  table descriptor as JSON\n"
        "  tables [schema]                                   list tables\n"
        "  policies <table> <op>                             policies for (table, op)\n"
        "  build <op> <table> [values-json] [filters-json]   print the statement\n"
        "  exec <op> <table> <token> [values-json] [filters-json]\n"
        "                                                    build and execute as the token subject\n"
        "  issue <subject> [ttl-seconds]                     issue a signed token\n"
        "  verify <token>                                    verify a token\n";
}

template<typename T>
int report(const Result<T>& result) {
    std::cerr << std::format("error: {}: {}\n",
        error_category_to_string(result.error_category()), result.error_message());
    return 2;
}

std::string arg_or_empty(const std::vector<std::string>& args, size_t idx) {
    return idx < args.size() ? args[idx] : std::string();
}

std::string statement_to_json(const Statement& stmt) {
    std::string params = "[";
    for (size_t i = 0; i < stmt.params.size(); ++i) {
        if (i > 0) params += ",";
        params += ValueMapper::to_json(stmt.params[i]);
    }
    params += "]";
    return std::format(R"({{"sql":{},"params":{},"check_guard":{}}})",
        JsonValue(stmt.sql).dump(), params, stmt.has_check_guard ? "true" : "false");
}

std::string execution_to_json(const ExecutionResult& result) {
    std::string rows = "[";
    for (size_t i = 0; i < result.rows.size(); ++i) {
        if (i > 0) rows += ",";
        rows += result.rows[i];
    }
    rows += "]";
    return std::format(R"({{"rows":{},"affected_rows":{}}})", rows, result.affected_rows);
}

ClaimsConfig claims_config(const AuthConfig& auth) {
    ClaimsConfig cfg;
    cfg.issuer = auth.issuer;
    cfg.audience = auth.audience;
    cfg.secret = auth.secret;
    cfg.token_ttl = std::chrono::seconds(auth.token_ttl_seconds);
    cfg.clock_skew = std::chrono::milliseconds(auth.clock_skew_ms);
    return cfg;
}

int run_claims_command(const std::string& command,
                       const std::vector<std::string>& args,
                       const ClaimsService& claims) {
    if (command == "issue") {
        if (args.empty()) { print_usage(); return 1; }
        auto issued = claims.issue(args[0]);
        if (args.size() > 1) {
            const auto ttl = utils::try_parse_int<int64_t>(args[1]);
            if (!ttl || *ttl <= 0) {
                std::cerr << std::format("error: invalid ttl '{}'\n", args[1]);
                return 1;
            }
            const auto& cfg = claims.config();
            issued = claims.issue(args[0], cfg.issuer, cfg.audience, std::chrono::seconds(*ttl));
        }
        std::cout << std::format(R"({{"token":{},"claims":{}}})",
            JsonValue(claims.sign(issued)).dump(), ClaimsService::to_json(issued)) << "\n";
        return 0;
    }

    // verify
    if (args.empty()) { print_usage(); return 1; }
    const auto verified = claims.verify(args[0]);
    if (verified.is_error()) return report(verified);
    std::cout << ClaimsService::to_json(verified.value()) << "\n";
    return 0;
}

int run_database_command(const std::string& command,
                         const std::vector<std::string>& args,
                         const EngineConfig& config,
                         const ClaimsService& claims) {
    const auto& db = config.database;

    PgConnectionFactory factory;
    auto conn = factory.create(db.connection_string);
    if (!conn) {
        std::cerr << "error: cannot connect to database\n";
        return 3;
    }

    CatalogReaderOptions options;
    options.default_schema = db.default_schema;
    options.policy_schema = db.policy_schema;
    options.policy_table = db.policy_table;

    PgCatalogReader catalog(*conn, options);

    std::unique_ptr<IPolicyStore> policies;
    if (db.policy_source == PolicySource::FILE) {
        const auto loaded = PolicyLoader::load_from_file(db.policy_file);
        if (!loaded.success) {
            std::cerr << std::format("error: config_error: {}\n", loaded.error_message);
            return 1;
        }
        auto store = std::make_unique<PolicyStore>(db.default_schema);
        store->load_policies(loaded.policies);
        utils::log::info(std::format("Loaded {} policies from {}", store->policy_count(), db.policy_file));
        policies = std::move(store);
    } else {
        policies = std::make_unique<PgPolicyStore>(*conn, options);
    }

    StatementExecutor::Config exec_config;
    exec_config.statement_timeout_ms = db.statement_timeout_ms;
    StatementExecutor executor(*conn, exec_config);

    TableAccessEngine engine(catalog, *policies, claims, &executor, db.default_schema);

    if (command == "describe") {
        if (args.empty()) { print_usage(); return 1; }
        const auto table = engine.describe(args[0]);
        if (table.is_error()) return report(table);
        std::cout << DescriptorParser::to_json(table.value()).dump() << "\n";
        return 0;
    }

    if (command == "tables") {
        const auto tables = engine.list_tables(arg_or_empty(args, 0));
        if (tables.is_error()) return report(tables);
        auto out = JsonValue::array();
        for (const auto& name : tables.value()) out.push_back(name);
        std::cout << out.dump() << "\n";
        return 0;
    }

    if (args.size() < 2) { print_usage(); return 1; }

    if (command == "policies") {
        const auto op = parse_operation(args[1]);
        if (!op) {
            std::cerr << std::format("error: unknown operation '{}'\n", args[1]);
            return 1;
        }
        const auto found = engine.policies_for(args[0], *op);
        if (found.is_error()) return report(found);
        auto out = JsonValue::array();
        for (const auto& policy : found.value()) out.push_back(DescriptorParser::to_json(policy));
        std::cout << out.dump() << "\n";
        return 0;
    }

    // build / exec: <op> <table> ...
    const auto op = parse_operation(args[0]);
    if (!op || *op == Operation::ALL) {
        std::cerr << std::format("error: unknown operation '{}'\n", args[0]);
        return 1;
    }
    const std::string& table = args[1];

    if (command == "build") {
        const auto stmt = engine.build_json(table, *op, arg_or_empty(args, 2), arg_or_empty(args, 3));
        if (stmt.is_error()) return report(stmt);
        std::cout << statement_to_json(stmt.value()) << "\n";
        return 0;
    }

    // exec
    if (args.size() < 3) { print_usage(); return 1; }
    BuildRequest request;
    request.table = table;
    request.operation = *op;
    const auto map_payload = [&](size_t idx, std::vector<FieldValue>& target) -> Result<bool> {
        const std::string payload = arg_or_empty(args, idx);
        if (utils::trim(payload).empty()) return Result<bool>::ok(true);
        auto fields = ValueMapper::map_object(payload);
        if (fields.is_error()) return Result<bool>::error_from(fields);
        target = std::move(fields.value());
        return Result<bool>::ok(true);
    };
    if (const auto mapped = map_payload(3, request.values); mapped.is_error()) return report(mapped);
    if (const auto mapped = map_payload(4, request.filters); mapped.is_error()) return report(mapped);

    const auto result = engine.execute(std::move(request), args[2]);
    if (result.is_error()) return report(result);
    std::cout << execution_to_json(result.value()) << "\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file = "tablegate.toml";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_file = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    const auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        std::cerr << std::format("error: config_error: {}\n", config_result.error_message);
        return 1;
    }
    const auto& config = config_result.config;

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    const std::string command = positional[0];
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    try {
        const ClaimsService claims(claims_config(config.auth));

        if (command == "issue" || command == "verify") {
            return run_claims_command(command, args, claims);
        }
        if (command == "describe" || command == "tables" || command == "policies" ||
            command == "build" || command == "exec") {
            return run_database_command(command, args, config, claims);
        }

        std::cerr << std::format("error: unknown command '{}'\n", command);
        print_usage();
        return 1;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
