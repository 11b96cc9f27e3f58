#include <catch2/catch_test_macros.hpp>
#include "policy/predicate_merger.hpp"

using namespace tablegate;

namespace {

Policy make_policy(int64_t id, Operation op, PolicyKind kind,
                   std::optional<std::string> using_expr,
                   std::optional<std::string> check_expr = std::nullopt) {
    Policy p;
    p.id = id;
    p.name = "p" + std::to_string(id);
    p.table_name = "users";
    p.operation = op;
    p.kind = kind;
    p.using_expr = std::move(using_expr);
    p.check_expr = std::move(check_expr);
    return p;
}

Policy permissive(int64_t id, std::string expr, Operation op = Operation::SELECT) {
    return make_policy(id, op, PolicyKind::PERMISSIVE, std::move(expr));
}

Policy restrictive(int64_t id, std::string expr, Operation op = Operation::SELECT) {
    return make_policy(id, op, PolicyKind::RESTRICTIVE, std::move(expr));
}

} // anonymous namespace

TEST_CASE("PredicateMerger: no policies on table adds nothing", "[merge]") {
    const auto pred = PredicateMerger::merge_using({}, Operation::SELECT, false);
    CHECK(pred.is_unrestricted());
    CHECK(pred.sql.empty());
}

TEST_CASE("PredicateMerger: single permissive policy", "[merge]") {
    const auto pred = PredicateMerger::merge_using(
        {permissive(1, "owner_id = 7")}, Operation::SELECT, true);
    REQUIRE(pred.kind == Predicate::Kind::CONDITION);
    CHECK(pred.sql == "(owner_id = 7)");
}

TEST_CASE("PredicateMerger: permissive OR, restrictive AND", "[merge]") {
    SECTION("P1 AND R1") {
        const auto pred = PredicateMerger::merge_using(
            {permissive(1, "a"), restrictive(2, "r")}, Operation::SELECT, true);
        CHECK(pred.sql == "(a) AND (r)");
    }

    SECTION("(P1 OR P2) AND R1") {
        const auto pred = PredicateMerger::merge_using(
            {permissive(1, "a"), permissive(2, "b"), restrictive(3, "r")}, Operation::SELECT, true);
        CHECK(pred.sql == "((a) OR (b)) AND (r)");
    }

    SECTION("(P1 OR P2) AND R1 AND R2") {
        const auto pred = PredicateMerger::merge_using(
            {restrictive(4, "r2"), permissive(1, "a"), restrictive(3, "r1"), permissive(2, "b")},
            Operation::SELECT, true);
        CHECK(pred.sql == "((a) OR (b)) AND (r2) AND (r1)");
    }

    SECTION("Disjunction alone is grouped") {
        const auto pred = PredicateMerger::merge_using(
            {permissive(1, "a"), permissive(2, "b")}, Operation::SELECT, true);
        CHECK(pred.sql == "((a) OR (b))");
    }
}

TEST_CASE("PredicateMerger: default deny", "[merge]") {
    SECTION("Only restrictive policies") {
        const auto pred = PredicateMerger::merge_using(
            {restrictive(1, "r")}, Operation::SELECT, true);
        CHECK(pred.is_deny());
        CHECK(pred.sql == "false");
    }

    SECTION("Table has policies for other operations only") {
        const auto pred = PredicateMerger::merge_using({}, Operation::DELETE, true);
        CHECK(pred.is_deny());
    }

    SECTION("Policy for another operation does not count") {
        const auto pred = PredicateMerger::merge_using(
            {permissive(1, "a", Operation::UPDATE)}, Operation::SELECT, true);
        CHECK(pred.is_deny());
    }
}

TEST_CASE("PredicateMerger: wildcard operation applies everywhere", "[merge]") {
    const std::vector<Policy> policies = {permissive(1, "mine", Operation::ALL)};
    for (const auto op : {Operation::SELECT, Operation::UPDATE, Operation::DELETE}) {
        CHECK(PredicateMerger::merge_using(policies, op, true).sql == "(mine)");
    }
}

TEST_CASE("PredicateMerger: disabled policies are ignored", "[merge]") {
    auto p = permissive(1, "a");
    p.is_enabled = false;
    CHECK(PredicateMerger::merge_using({p}, Operation::SELECT, true).is_deny());
}

TEST_CASE("PredicateMerger: check clause", "[merge]") {
    SECTION("Insert uses check_expr only") {
        const std::vector<Policy> policies = {
            make_policy(1, Operation::INSERT, PolicyKind::PERMISSIVE, "ignored", "owner_id = 7")
        };
        const auto check = PredicateMerger::merge_check(policies, Operation::INSERT, true);
        CHECK(check.sql == "(owner_id = 7)");
        CHECK(PredicateMerger::merge_using(policies, Operation::INSERT, true).is_unrestricted());
    }

    SECTION("Insert-only policy without check denies") {
        const std::vector<Policy> policies = {
            make_policy(1, Operation::INSERT, PolicyKind::PERMISSIVE, "a")
        };
        CHECK(PredicateMerger::merge_check(policies, Operation::INSERT, true).is_deny());
    }

    SECTION("Update falls back to using_expr") {
        const std::vector<Policy> policies = {
            make_policy(1, Operation::UPDATE, PolicyKind::PERMISSIVE, "owner_id = 7"),
            make_policy(2, Operation::UPDATE, PolicyKind::RESTRICTIVE, "x", "amount > 0")
        };
        CHECK(PredicateMerger::merge_check(policies, Operation::UPDATE, true).sql ==
              "(owner_id = 7) AND (amount > 0)");
        CHECK(PredicateMerger::merge_using(policies, Operation::UPDATE, true).sql ==
              "(owner_id = 7) AND (x)");
    }

    SECTION("Wildcard policy falls back on insert") {
        const std::vector<Policy> policies = {
            make_policy(1, Operation::ALL, PolicyKind::PERMISSIVE, "mine")
        };
        CHECK(PredicateMerger::merge_check(policies, Operation::INSERT, true).sql == "(mine)");
    }

    SECTION("Select and delete have no check clause") {
        const std::vector<Policy> policies = {permissive(1, "a", Operation::ALL)};
        CHECK(PredicateMerger::merge_check(policies, Operation::SELECT, true).is_unrestricted());
        CHECK(PredicateMerger::merge_check(policies, Operation::DELETE, true).is_unrestricted());
    }

    SECTION("No policies on table") {
        CHECK(PredicateMerger::merge_check({}, Operation::INSERT, false).is_unrestricted());
    }
}
