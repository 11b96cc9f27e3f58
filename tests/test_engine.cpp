#include <catch2/catch_test_macros.hpp>
#include "engine/table_access_engine.hpp"
#include "policy/policy_store.hpp"
#include "mocks/mock_db_connection.hpp"

#include <map>

using namespace tablegate;
using namespace std::chrono_literals;
using tablegate::testing::MockDbConnection;

namespace {

// In-memory catalog keyed by "schema.table"
class FakeCatalog : public ICatalogReader {
public:
    void add(TableDescriptor table) {
        tables_[table.qualified_name()] = std::move(table);
    }

    Result<TableDescriptor> describe(const std::string& table_name) override {
        ++describe_calls;
        const auto it = tables_.find(table_name);
        if (it == tables_.end()) {
            return Result<TableDescriptor>::error(ErrorCategory::NOT_FOUND,
                                                  "Table '" + table_name + "' does not exist");
        }
        return Result<TableDescriptor>::ok(it->second);
    }

    Result<std::vector<std::string>> list_tables(const std::string& schema) override {
        std::vector<std::string> names;
        for (const auto& [key, table] : tables_) {
            if (table.schema == schema) names.push_back(table.name);
        }
        return Result<std::vector<std::string>>::ok(std::move(names));
    }

    int describe_calls = 0;

private:
    std::map<std::string, TableDescriptor> tables_;
};

ColumnDescriptor column(int position, std::string name, bool pk = false) {
    ColumnDescriptor c;
    c.position = position;
    c.name = std::move(name);
    c.is_primary_key = pk;
    if (pk) c.primary_key_order = 1;
    return c;
}

TableDescriptor orders_table() {
    TableDescriptor t;
    t.name = "orders";
    t.schema = "public";
    t.columns = {column(1, "id", true), column(2, "owner_id"), column(3, "amount")};
    return t;
}

Policy owner_policy() {
    Policy p;
    p.id = 1;
    p.name = "own_orders";
    p.table_name = "orders";
    p.operation = Operation::ALL;
    p.using_expr = "owner_id = current_setting('request.jwt.claim.sub', true)::bigint";
    return p;
}

ClaimsConfig claims_config() {
    ClaimsConfig cfg;
    cfg.issuer = "tablegate";
    cfg.audience = "tablegate-clients";
    cfg.secret = "engine-secret";
    return cfg;
}

struct Fixture {
    FakeCatalog catalog;
    PolicyStore policies;
    ClaimsService claims{claims_config()};
    MockDbConnection conn;
    StatementExecutor executor{conn};
    TableAccessEngine engine{catalog, policies, claims, &executor};

    Fixture() {
        catalog.add(orders_table());
        policies.load_policies({owner_policy()});
    }
};

} // anonymous namespace

TEST_CASE("TableAccessEngine: catalog passthrough", "[engine]") {
    Fixture f;

    const auto described = f.engine.describe("public.orders");
    REQUIRE(described.is_ok());
    CHECK(described.value().columns.size() == 3);

    CHECK(f.engine.describe("public.ghost").error_category() == ErrorCategory::NOT_FOUND);

    const auto tables = f.engine.list_tables("");
    REQUIRE(tables.is_ok());
    CHECK(tables.value() == std::vector<std::string>{"orders"});

    const auto policies = f.engine.policies_for("orders", Operation::DELETE);
    REQUIRE(policies.is_ok());
    REQUIRE(policies.value().size() == 1);
    CHECK(policies.value()[0].name == "own_orders");
}

TEST_CASE("TableAccessEngine: build merges policies", "[engine]") {
    Fixture f;

    BuildRequest req;
    req.table = "orders";
    req.operation = Operation::SELECT;
    req.filters = {{"id", TypedParam::int64(3)}};

    const auto r = f.engine.build(req);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql ==
          R"(SELECT row_to_json("orders".*) AS data FROM "public"."orders" )"
          R"(WHERE (owner_id = current_setting('request.jwt.claim.sub', true)::bigint) AND "id" = $1 )"
          R"(ORDER BY "id")");
    CHECK(r.value().target == R"("public"."orders")");
}

TEST_CASE("TableAccessEngine: build from JSON", "[engine]") {
    Fixture f;

    SECTION("Update") {
        const auto r = f.engine.build_json("public.orders", Operation::UPDATE,
                                           R"({"amount": 12.5})", R"({"id": 3})");
        REQUIRE(r.is_ok());
        CHECK(r.value().has_check_guard);
        REQUIRE(r.value().params.size() == 2);
        CHECK(r.value().params[0] == TypedParam::float64(12.5));
        CHECK(r.value().params[1] == TypedParam::int64(3));
    }

    SECTION("Empty write set") {
        CHECK(f.engine.build_json("orders", Operation::INSERT, "{}", "").error_category() ==
              ErrorCategory::EMPTY_WRITE_SET);
    }

    SECTION("Unknown column") {
        CHECK(f.engine.build_json("orders", Operation::INSERT, R"({"nickname": "x"})", "")
                  .error_category() == ErrorCategory::INVALID_COLUMN_SET);
    }

    SECTION("Payload is not an object") {
        CHECK(f.engine.build_json("orders", Operation::INSERT, "[1,2]", "").error_category() ==
              ErrorCategory::INVALID_PAYLOAD);
    }
}

TEST_CASE("TableAccessEngine: table resolution", "[engine]") {
    Fixture f;

    SECTION("Unsafe table name never reaches the catalog") {
        BuildRequest req;
        req.table = "orders\"; DROP TABLE orders; --";
        req.operation = Operation::SELECT;
        CHECK(f.engine.build(req).error_category() == ErrorCategory::INVALID_COLUMN_SET);
        CHECK(f.catalog.describe_calls == 0);
    }

    SECTION("Unknown table") {
        BuildRequest req;
        req.table = "invoices";
        req.operation = Operation::SELECT;
        CHECK(f.engine.build(req).error_category() == ErrorCategory::NOT_FOUND);
    }
}

TEST_CASE("TableAccessEngine: default deny", "[engine]") {
    Fixture f;
    Policy insert_only = owner_policy();
    insert_only.operation = Operation::INSERT;
    insert_only.using_expr.reset();
    insert_only.check_expr = "amount > 0";
    f.policies.load_policies({insert_only});

    BuildRequest req;
    req.table = "orders";
    req.operation = Operation::SELECT;
    const auto r = f.engine.build(req);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql.find("WHERE false") != std::string::npos);
}

TEST_CASE("TableAccessEngine: execute", "[engine]") {
    Fixture f;
    f.conn.on("SELECT row_to_json", MockDbConnection::rows({"data"}, {{R"({"id":3})"}}));

    BuildRequest req;
    req.table = "orders";
    req.operation = Operation::SELECT;

    SECTION("Valid token") {
        const auto token = f.engine.sign(f.engine.issue("7"));
        const auto r = f.engine.execute(req, token);
        REQUIRE(r.is_ok());
        CHECK(r.value().rows == std::vector<std::string>{R"({"id":3})"});

        REQUIRE(f.conn.count("set_config") == 1);
        CHECK(f.conn.calls[0].params[0] == TypedParam::string("7"));
    }

    SECTION("Invalid token is rejected before any database work") {
        const auto r = f.engine.execute(req, "not-a-token");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::SIGNATURE_INVALID);
        CHECK(f.catalog.describe_calls == 0);
        CHECK(f.conn.calls.empty());
    }

    SECTION("Token signed with another key") {
        const auto token = ClaimsService::sign(f.engine.issue("7"), "other-secret");
        CHECK(f.engine.execute(req, token).error_category() == ErrorCategory::SIGNATURE_INVALID);
    }

    SECTION("Expired token") {
        auto claims = f.engine.issue("7", 1s);
        claims.expiration = claims.issued_at - 1s;
        const auto token = f.engine.sign(claims);
        CHECK(f.engine.execute(req, token).error_category() == ErrorCategory::EXPIRED);
    }
}

TEST_CASE("TableAccessEngine: execute without executor", "[engine]") {
    FakeCatalog catalog;
    PolicyStore policies;
    ClaimsService claims{claims_config()};
    TableAccessEngine engine(catalog, policies, claims);

    BuildRequest req;
    req.table = "orders";
    req.operation = Operation::SELECT;
    const auto token = engine.sign(engine.issue("7"));
    CHECK(engine.execute(req, token).error_category() == ErrorCategory::EXECUTION_ERROR);
}
