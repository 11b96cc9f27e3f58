#include <catch2/catch_test_macros.hpp>
#include "query/query_builder.hpp"

using namespace tablegate;

namespace {

BuildRequest make_request(Operation op) {
    BuildRequest req;
    req.schema = "public";
    req.table = "users";
    req.operation = op;
    return req;
}

Policy make_policy(Operation op, PolicyKind kind,
                   std::optional<std::string> using_expr,
                   std::optional<std::string> check_expr = std::nullopt) {
    Policy p;
    p.id = 1;
    p.name = "p";
    p.table_name = "users";
    p.operation = op;
    p.kind = kind;
    p.using_expr = std::move(using_expr);
    p.check_expr = std::move(check_expr);
    return p;
}

TableDescriptor users_descriptor() {
    TableDescriptor t;
    t.name = "users";
    t.schema = "public";

    ColumnDescriptor id;
    id.position = 1;
    id.name = "id";
    id.is_primary_key = true;
    id.primary_key_order = 1;

    ColumnDescriptor email;
    email.position = 2;
    email.name = "email";

    ColumnDescriptor search;
    search.position = 3;
    search.name = "search";
    search.generation_kind = GenerationKind::STORED;

    t.columns = {id, email, search};
    return t;
}

} // anonymous namespace

TEST_CASE("QueryBuilder: select without policies", "[builder]") {
    const auto r = QueryBuilder::build(make_request(Operation::SELECT), {}, false);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql == R"(SELECT row_to_json("users".*) AS data FROM "public"."users")");
    CHECK(r.value().params.empty());
    CHECK_FALSE(r.value().has_check_guard);
    CHECK(r.value().target == R"("public"."users")");
}

TEST_CASE("QueryBuilder: select with policy and filters", "[builder]") {
    auto req = make_request(Operation::SELECT);
    req.filters = {{"email", TypedParam::string("a@b.c")}, {"deleted_at", TypedParam::null()}};
    req.limit = 10;
    req.offset = 20;

    const auto r = QueryBuilder::build(
        req, {make_policy(Operation::SELECT, PolicyKind::PERMISSIVE, "owner_id = 7")}, true);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql ==
          R"(SELECT row_to_json("users".*) AS data FROM "public"."users" )"
          R"(WHERE (owner_id = 7) AND "email" = $1 AND "deleted_at" IS NULL LIMIT $2 OFFSET $3)");
    REQUIRE(r.value().params.size() == 3);
    CHECK(r.value().params[0] == TypedParam::string("a@b.c"));
    CHECK(r.value().params[1] == TypedParam::int64(10));
    CHECK(r.value().params[2] == TypedParam::int64(20));
}

TEST_CASE("QueryBuilder: select projection and primary key order", "[builder]") {
    auto req = make_request(Operation::SELECT);
    req.columns = {"id", "email"};
    const auto descriptor = users_descriptor();

    const auto r = QueryBuilder::build(req, {}, false, &descriptor);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql ==
          R"(SELECT json_build_object('id', "id", 'email', "email") AS data )"
          R"(FROM "public"."users" ORDER BY "id")");
}

TEST_CASE("QueryBuilder: deny renders false", "[builder]") {
    const auto restrictive = make_policy(Operation::SELECT, PolicyKind::RESTRICTIVE, "r");
    const auto r = QueryBuilder::build(make_request(Operation::SELECT), {restrictive}, true);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql == R"(SELECT row_to_json("users".*) AS data FROM "public"."users" WHERE false)");
}

TEST_CASE("QueryBuilder: insert", "[builder]") {
    auto req = make_request(Operation::INSERT);
    req.values = {{"email", TypedParam::string("a@b.c")}, {"tags", TypedParam::json("[1,2]")}};

    SECTION("Unrestricted table has no guard") {
        const auto r = QueryBuilder::build(req, {}, false);
        REQUIRE(r.is_ok());
        CHECK(r.value().sql ==
              R"(INSERT INTO "public"."users" ("email", "tags") VALUES ($1, $2::jsonb) )"
              R"(RETURNING row_to_json("users".*) AS data)");
        CHECK_FALSE(r.value().has_check_guard);
        CHECK(r.value().params.size() == 2);
    }

    SECTION("Check policy becomes a returning guard") {
        const auto r = QueryBuilder::build(
            req, {make_policy(Operation::INSERT, PolicyKind::PERMISSIVE, std::nullopt, "owner_id = 7")}, true);
        REQUIRE(r.is_ok());
        CHECK(r.value().sql ==
              R"(INSERT INTO "public"."users" ("email", "tags") VALUES ($1, $2::jsonb) )"
              R"(RETURNING row_to_json("users".*) AS data, COALESCE(((owner_id = 7)), false) AS check_passed)");
        CHECK(r.value().has_check_guard);
    }
}

TEST_CASE("QueryBuilder: update", "[builder]") {
    auto req = make_request(Operation::UPDATE);
    req.values = {{"email", TypedParam::string("new@b.c")}};
    req.filters = {{"id", TypedParam::int64(5)}};

    const auto r = QueryBuilder::build(
        req, {make_policy(Operation::ALL, PolicyKind::PERMISSIVE, "owner_id = 7")}, true);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql ==
          R"(UPDATE "public"."users" SET "email" = $1 WHERE (owner_id = 7) AND "id" = $2 )"
          R"(RETURNING row_to_json("users".*) AS data, COALESCE(((owner_id = 7)), false) AS check_passed)");
    CHECK(r.value().has_check_guard);
    REQUIRE(r.value().params.size() == 2);
    CHECK(r.value().params[1] == TypedParam::int64(5));
}

TEST_CASE("QueryBuilder: delete", "[builder]") {
    auto req = make_request(Operation::DELETE);
    req.filters = {{"id", TypedParam::int64(5)}};

    const auto r = QueryBuilder::build(
        req, {make_policy(Operation::DELETE, PolicyKind::PERMISSIVE, "owner_id = 7")}, true);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql ==
          R"(DELETE FROM "public"."users" WHERE (owner_id = 7) AND "id" = $1 )"
          R"(RETURNING row_to_json("users".*) AS data)");
    CHECK_FALSE(r.value().has_check_guard);
}

TEST_CASE("QueryBuilder: identifier validation", "[builder]") {
    SECTION("Unsafe column names are rejected") {
        for (const char* name : {"email\"", "email;", "e mail", "1email", "", "email--", "e\tmail"}) {
            INFO(name);
            auto req = make_request(Operation::INSERT);
            req.values = {{name, TypedParam::int64(1)}};
            const auto r = QueryBuilder::build(req, {}, false);
            REQUIRE(r.is_error());
            CHECK(r.error_category() == ErrorCategory::INVALID_COLUMN_SET);
        }
    }

    SECTION("Simple identifiers are accepted") {
        for (const char* name : {"email", "_private", "Col_9", "x"}) {
            INFO(name);
            auto req = make_request(Operation::SELECT);
            req.filters = {{name, TypedParam::int64(1)}};
            CHECK(QueryBuilder::build(req, {}, false).is_ok());
        }
    }

    SECTION("Table and schema names are checked") {
        auto req = make_request(Operation::SELECT);
        req.table = "users; DROP TABLE users";
        CHECK(QueryBuilder::build(req, {}, false).error_category() == ErrorCategory::INVALID_COLUMN_SET);

        req = make_request(Operation::SELECT);
        req.schema = "pub lic";
        CHECK(QueryBuilder::build(req, {}, false).error_category() == ErrorCategory::INVALID_COLUMN_SET);
    }

    SECTION("Projection columns are checked") {
        auto req = make_request(Operation::SELECT);
        req.columns = {"id", "email'"};
        CHECK(QueryBuilder::build(req, {}, false).error_category() == ErrorCategory::INVALID_COLUMN_SET);
    }
}

TEST_CASE("QueryBuilder: write set", "[builder]") {
    SECTION("Insert with no columns") {
        const auto r = QueryBuilder::build(make_request(Operation::INSERT), {}, false);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::EMPTY_WRITE_SET);
    }

    SECTION("Update with no columns") {
        auto req = make_request(Operation::UPDATE);
        req.filters = {{"id", TypedParam::int64(1)}};
        CHECK(QueryBuilder::build(req, {}, false).error_category() == ErrorCategory::EMPTY_WRITE_SET);
    }

    SECTION("Column assigned twice") {
        auto req = make_request(Operation::INSERT);
        req.values = {{"email", TypedParam::string("a")}, {"email", TypedParam::string("b")}};
        CHECK(QueryBuilder::build(req, {}, false).error_category() == ErrorCategory::INVALID_COLUMN_SET);
    }
}

TEST_CASE("QueryBuilder: descriptor-aware validation", "[builder]") {
    const auto descriptor = users_descriptor();

    SECTION("Unknown column") {
        auto req = make_request(Operation::INSERT);
        req.values = {{"nickname", TypedParam::string("x")}};
        CHECK(QueryBuilder::build(req, {}, false, &descriptor).error_category() ==
              ErrorCategory::INVALID_COLUMN_SET);
    }

    SECTION("Generated column cannot be written") {
        auto req = make_request(Operation::UPDATE);
        req.values = {{"search", TypedParam::string("x")}};
        CHECK(QueryBuilder::build(req, {}, false, &descriptor).error_category() ==
              ErrorCategory::INVALID_COLUMN_SET);
    }

    SECTION("Generated column can be filtered on") {
        auto req = make_request(Operation::SELECT);
        req.filters = {{"search", TypedParam::string("x")}};
        CHECK(QueryBuilder::build(req, {}, false, &descriptor).is_ok());
    }
}

TEST_CASE("QueryBuilder: malformed requests", "[builder]") {
    SECTION("Wildcard operation") {
        CHECK(QueryBuilder::build(make_request(Operation::ALL), {}, false).error_category() ==
              ErrorCategory::INVALID_PAYLOAD);
    }

    SECTION("Negative limit") {
        auto req = make_request(Operation::SELECT);
        req.limit = -1;
        CHECK(QueryBuilder::build(req, {}, false).error_category() == ErrorCategory::INVALID_PAYLOAD);
    }

    SECTION("Insert with filters") {
        auto req = make_request(Operation::INSERT);
        req.values = {{"email", TypedParam::string("a")}};
        req.filters = {{"id", TypedParam::int64(1)}};
        CHECK(QueryBuilder::build(req, {}, false).error_category() == ErrorCategory::INVALID_PAYLOAD);
    }
}
