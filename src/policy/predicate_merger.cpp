#include "policy/predicate_merger.hpp"

namespace tablegate {

namespace {

std::string join_wrapped(const std::vector<std::string>& fragments, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < fragments.size(); ++i) {
        if (i > 0) out += sep;
        out += '(';
        out += fragments[i];
        out += ')';
    }
    return out;
}

} // anonymous namespace

Predicate PredicateMerger::merge_using(const std::vector<Policy>& policies,
                                       Operation op,
                                       bool table_has_policies) {
    // INSERT has no existing row to select
    if (op == Operation::INSERT) {
        return Predicate::unrestricted();
    }

    std::vector<std::string> permissive;
    std::vector<std::string> restrictive;

    for (const auto& policy : policies) {
        if (!policy.is_enabled || !policy.applies_to(op) || !policy.using_expr) continue;
        auto& bucket = policy.kind == PolicyKind::PERMISSIVE ? permissive : restrictive;
        bucket.push_back(*policy.using_expr);
    }
    return combine(permissive, restrictive, table_has_policies);
}

Predicate PredicateMerger::merge_check(const std::vector<Policy>& policies,
                                       Operation op,
                                       bool table_has_policies) {
    if (op != Operation::INSERT && op != Operation::UPDATE) {
        return Predicate::unrestricted();
    }

    std::vector<std::string> permissive;
    std::vector<std::string> restrictive;

    for (const auto& policy : policies) {
        if (!policy.is_enabled || !policy.applies_to(op)) continue;

        const std::optional<std::string>* expr = &policy.check_expr;
        if (!*expr && (op == Operation::UPDATE || policy.operation == Operation::ALL)) {
            expr = &policy.using_expr;
        }
        if (!*expr) continue;

        auto& bucket = policy.kind == PolicyKind::PERMISSIVE ? permissive : restrictive;
        bucket.push_back(**expr);
    }
    return combine(permissive, restrictive, table_has_policies);
}

Predicate PredicateMerger::combine(const std::vector<std::string>& permissive,
                                   const std::vector<std::string>& restrictive,
                                   bool table_has_policies) {
    if (!table_has_policies) {
        return Predicate::unrestricted();
    }
    if (permissive.empty()) {
        return Predicate::deny();
    }

    // A multi-term disjunction is grouped so the result can be AND-ed with anything
    std::string sql = join_wrapped(permissive, " OR ");
    if (permissive.size() > 1) {
        sql = "(" + sql + ")";
    }
    if (!restrictive.empty()) {
        sql += " AND ";
        sql += join_wrapped(restrictive, " AND ");
    }
    return Predicate::condition(std::move(sql));
}

} // namespace tablegate
