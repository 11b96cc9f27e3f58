#include <catch2/catch_test_macros.hpp>
#include "policy/policy_loader.hpp"

using namespace tablegate;

namespace {

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("PolicyLoader: full policy", "[policy_loader]") {
    const auto result = PolicyLoader::load_from_string(R"(
[[policies]]
id = 10
name = "own_rows"
table = "public.orders"
operation = "update"
type = "restrictive"
using = "owner_id = current_setting('request.jwt.claim.sub')::bigint"
check = "amount >= 0"
enabled = false
description = "Owners edit their own orders"
)");
    REQUIRE(result.success);
    REQUIRE(result.policies.size() == 1);

    const auto& p = result.policies[0];
    CHECK(p.id == 10);
    CHECK(p.name == "own_rows");
    CHECK(p.table_name == "public.orders");
    CHECK(p.operation == Operation::UPDATE);
    CHECK(p.kind == PolicyKind::RESTRICTIVE);
    CHECK(p.using_expr == "owner_id = current_setting('request.jwt.claim.sub')::bigint");
    CHECK(p.check_expr == "amount >= 0");
    CHECK_FALSE(p.is_enabled);
    CHECK(p.description == "Owners edit their own orders");
}

TEST_CASE("PolicyLoader: defaults", "[policy_loader]") {
    const auto result = PolicyLoader::load_from_string(R"(
[[policies]]
name = "a"
table = "users"
using = "is_active"

[[policies]]
id = 7
name = "b"
table = "users"
check = "role_id IS NOT NULL"

[[policies]]
name = "c"
table = "users"
using = "true"
)");
    REQUIRE(result.success);
    REQUIRE(result.policies.size() == 3);

    const auto& a = result.policies[0];
    CHECK(a.id == 1);
    CHECK(a.operation == Operation::ALL);
    CHECK(a.kind == PolicyKind::PERMISSIVE);
    CHECK(a.is_enabled);
    CHECK_FALSE(a.check_expr.has_value());
    CHECK_FALSE(a.description.has_value());

    CHECK(result.policies[1].id == 7);
    CHECK_FALSE(result.policies[1].using_expr.has_value());
    // Auto ids continue after the largest explicit id
    CHECK(result.policies[2].id == 8);
}

TEST_CASE("PolicyLoader: empty input", "[policy_loader]") {
    const auto result = PolicyLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.policies.empty());
}

TEST_CASE("PolicyLoader: rejects invalid policies", "[policy_loader]") {
    SECTION("Unknown operation") {
        const auto r = PolicyLoader::load_from_string(R"(
[[policies]]
name = "a"
table = "users"
operation = "truncate"
using = "true"
)");
        CHECK_FALSE(r.success);
        CHECK(contains(r.error_message, "Invalid operation 'truncate'"));
    }

    SECTION("Unknown type") {
        const auto r = PolicyLoader::load_from_string(R"(
[[policies]]
name = "a"
table = "users"
type = "advisory"
using = "true"
)");
        CHECK_FALSE(r.success);
        CHECK(contains(r.error_message, "Invalid type 'advisory'"));
    }

    SECTION("Missing name") {
        const auto r = PolicyLoader::load_from_string(R"(
[[policies]]
table = "users"
using = "true"
)");
        CHECK_FALSE(r.success);
        CHECK(contains(r.error_message, "must have a name"));
    }

    SECTION("Missing table") {
        const auto r = PolicyLoader::load_from_string(R"(
[[policies]]
name = "a"
using = "true"
)");
        CHECK_FALSE(r.success);
        CHECK(contains(r.error_message, "must name a table"));
    }

    SECTION("No expression") {
        const auto r = PolicyLoader::load_from_string(R"(
[[policies]]
name = "a"
table = "users"
)");
        CHECK_FALSE(r.success);
        CHECK(contains(r.error_message, "'using', 'check', or both"));
    }

    SECTION("Blank expression") {
        const auto r = PolicyLoader::load_from_string(R"(
[[policies]]
name = "a"
table = "users"
using = "   "
)");
        CHECK_FALSE(r.success);
        CHECK(contains(r.error_message, "must not be empty"));
    }

    SECTION("Duplicate names") {
        const auto r = PolicyLoader::load_from_string(R"(
[[policies]]
name = "a"
table = "users"
using = "true"

[[policies]]
name = "a"
table = "orders"
using = "true"
)");
        CHECK_FALSE(r.success);
        CHECK(contains(r.error_message, "Duplicate policy name 'a'"));
    }

    SECTION("Malformed TOML") {
        const auto r = PolicyLoader::load_from_string("[[policies]\nname = ");
        CHECK_FALSE(r.success);
        CHECK(contains(r.error_message, "TOML parse error"));
    }
}

TEST_CASE("PolicyLoader: missing file", "[policy_loader]") {
    const auto r = PolicyLoader::load_from_file("/nonexistent/tablegate/policies.toml");
    CHECK_FALSE(r.success);
    CHECK(contains(r.error_message, "Cannot open policy file"));
}
