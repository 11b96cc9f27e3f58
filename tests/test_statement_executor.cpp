#include <catch2/catch_test_macros.hpp>
#include "executor/statement_executor.hpp"
#include "mocks/mock_db_connection.hpp"

using namespace tablegate;
using tablegate::testing::MockDbConnection;

namespace {

Statement make_update(bool guarded) {
    Statement stmt;
    stmt.sql = R"(UPDATE "public"."orders" SET "amount" = $1 RETURNING row_to_json("orders".*) AS data)";
    stmt.params = {TypedParam::int64(10)};
    stmt.operation = Operation::UPDATE;
    stmt.target = R"("public"."orders")";
    stmt.has_check_guard = guarded;
    return stmt;
}

Statement make_select() {
    Statement stmt;
    stmt.sql = R"(SELECT row_to_json("orders".*) AS data FROM "public"."orders")";
    stmt.operation = Operation::SELECT;
    stmt.target = R"("public"."orders")";
    return stmt;
}

Claims make_claims() {
    Claims c;
    c.subject = "user-7";
    c.issuer = "tablegate";
    c.audience = "tablegate-clients";
    c.token_id = "jti-1";
    return c;
}

} // anonymous namespace

TEST_CASE("StatementExecutor: select", "[executor]") {
    MockDbConnection conn;
    conn.on("SELECT row_to_json", MockDbConnection::rows({"data"},
        {{R"({"id":1,"amount":12345678901234567890})"}, {R"({"id":2,"amount":3})"}}));
    StatementExecutor executor(conn);

    const auto r = executor.execute(make_select(), nullptr);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().rows.size() == 2);
    // Raw JSON text is passed through untouched
    CHECK(r.value().rows[0] == R"({"id":1,"amount":12345678901234567890})");
    CHECK(r.value().affected_rows == 0);

    CHECK(conn.begin_count == 1);
    CHECK(conn.commit_count == 1);
    CHECK(conn.rollback_count == 0);
    // Anonymous: no claim settings
    CHECK(conn.count("set_config") == 0);
}

TEST_CASE("StatementExecutor: session claims", "[executor]") {
    MockDbConnection conn;
    StatementExecutor executor(conn);
    const auto claims = make_claims();

    REQUIRE(executor.execute(make_select(), &claims).is_ok());
    REQUIRE(conn.calls.size() == 2);

    const auto& session = conn.calls[0];
    CHECK(session.sql.find("request.jwt.claim.sub") != std::string::npos);
    REQUIRE(session.params.size() == 2);
    CHECK(session.params[0] == TypedParam::string("user-7"));
    const auto* payload = std::get_if<std::string>(&session.params[1].value);
    REQUIRE(payload != nullptr);
    CHECK(payload->find(R"("sub":"user-7")") != std::string::npos);

    // Statement runs after the claims are set
    CHECK(conn.calls[1].sql == make_select().sql);
}

TEST_CASE("StatementExecutor: check guard", "[executor]") {
    MockDbConnection conn;
    StatementExecutor executor(conn);

    SECTION("All rows pass") {
        conn.on("UPDATE", MockDbConnection::rows({"data", "check_passed"},
            {{R"({"id":1})", "t"}, {R"({"id":2})", "t"}}));
        const auto r = executor.execute(make_update(true), nullptr);
        REQUIRE(r.is_ok());
        CHECK(r.value().affected_rows == 2);
        CHECK(r.value().rows == std::vector<std::string>{R"({"id":1})", R"({"id":2})"});
        CHECK(conn.commit_count == 1);
        CHECK(conn.rollback_count == 0);
    }

    SECTION("One failing row rolls back everything") {
        conn.on("UPDATE", MockDbConnection::rows({"data", "check_passed"},
            {{R"({"id":1})", "t"}, {R"({"id":2})", "f"}}));
        const auto r = executor.execute(make_update(true), nullptr);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::POLICY_DENIED);
        CHECK(r.error_message() == "Write rejected");
        CHECK(conn.commit_count == 0);
        CHECK(conn.rollback_count == 1);
    }

    SECTION("Guard column missing") {
        conn.on("UPDATE", MockDbConnection::rows({"data"}, {{R"({"id":1})"}}));
        CHECK(executor.execute(make_update(true), nullptr).error_category() ==
              ErrorCategory::EXECUTION_ERROR);
        CHECK(conn.rollback_count == 1);
    }

    SECTION("No rows matched") {
        conn.on("UPDATE", MockDbConnection::rows({"data", "check_passed"}, {}));
        const auto r = executor.execute(make_update(true), nullptr);
        REQUIRE(r.is_ok());
        CHECK(r.value().affected_rows == 0);
        CHECK(conn.commit_count == 1);
    }
}

TEST_CASE("StatementExecutor: failures", "[executor]") {
    MockDbConnection conn;
    StatementExecutor executor(conn);

    SECTION("Statement error rolls back") {
        conn.on("UPDATE", MockDbConnection::failure("violates foreign key constraint"));
        const auto r = executor.execute(make_update(false), nullptr);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::EXECUTION_ERROR);
        CHECK(r.error_message() == "violates foreign key constraint");
        CHECK(conn.rollback_count == 1);
    }

    SECTION("Claim settings error rolls back") {
        conn.on("set_config", MockDbConnection::failure("permission denied"));
        const auto claims = make_claims();
        CHECK(executor.execute(make_select(), &claims).error_category() ==
              ErrorCategory::EXECUTION_ERROR);
        CHECK(conn.count("SELECT row_to_json") == 0);
        CHECK(conn.rollback_count == 1);
    }

    SECTION("Begin failure") {
        conn.begin_succeeds = false;
        CHECK(executor.execute(make_select(), nullptr).error_category() ==
              ErrorCategory::EXECUTION_ERROR);
        CHECK(conn.calls.empty());
        CHECK(conn.rollback_count == 0);
    }

    SECTION("Commit failure") {
        conn.commit_succeeds = false;
        CHECK(executor.execute(make_select(), nullptr).error_category() ==
              ErrorCategory::EXECUTION_ERROR);
        CHECK(conn.rollback_count == 0);
    }
}

TEST_CASE("StatementExecutor: statement timeout applied once", "[executor]") {
    MockDbConnection conn;
    StatementExecutor executor(conn, StatementExecutor::Config{1500});

    REQUIRE(executor.execute(make_select(), nullptr).is_ok());
    REQUIRE(executor.execute(make_select(), nullptr).is_ok());
    CHECK(conn.last_timeout_ms == 1500);
    CHECK(conn.begin_count == 2);
}
