#include "query/query_builder.hpp"
#include "core/utils.hpp"
#include "policy/predicate_merger.hpp"

#include <format>
#include <unordered_set>

namespace tablegate {

namespace {

// Appends parameters and hands back their placeholders
class ParamBinder {
public:
    std::string bind(const TypedParam& param) {
        params_.push_back(param);
        if (param.kind() == ParamKind::JSON) {
            return std::format("${}::jsonb", params_.size());
        }
        return std::format("${}", params_.size());
    }

    std::vector<TypedParam> take() { return std::move(params_); }

private:
    std::vector<TypedParam> params_;
};

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// WHERE clause from the using predicate and equality filters; empty when unrestricted
std::string where_clause(const Predicate& using_pred,
                         const std::vector<FieldValue>& filters,
                         ParamBinder& binder) {
    std::vector<std::string> terms;
    if (!using_pred.is_unrestricted()) {
        terms.push_back(using_pred.sql);
    }
    for (const auto& filter : filters) {
        const std::string column = utils::quote_identifier(filter.column);
        if (filter.param.is_null()) {
            terms.push_back(column + " IS NULL");
        } else {
            terms.push_back(std::format("{} = {}", column, binder.bind(filter.param)));
        }
    }
    if (terms.empty()) return {};
    return " WHERE " + join(terms, " AND ");
}

std::string returning_clause(const std::string& row_json, const Predicate& check) {
    std::string out = std::format(" RETURNING {} AS data", row_json);
    if (!check.is_unrestricted()) {
        out += std::format(", COALESCE(({}), false) AS check_passed", check.sql);
    }
    return out;
}

} // anonymous namespace

Result<Statement> QueryBuilder::build(const BuildRequest& request,
                                      const std::vector<Policy>& policies,
                                      bool table_has_policies,
                                      const TableDescriptor* descriptor) {
    using R = Result<Statement>;

    const auto valid = validate(request, descriptor);
    if (valid.is_error()) {
        return R::error_from(valid);
    }

    const Operation op = request.operation;
    const Predicate using_pred = PredicateMerger::merge_using(policies, op, table_has_policies);
    const Predicate check_pred = PredicateMerger::merge_check(policies, op, table_has_policies);

    const std::string table = utils::quote_identifier(request.table);
    Statement stmt;
    stmt.operation = op;
    stmt.target = request.schema.empty()
        ? table
        : std::format("{}.{}", utils::quote_identifier(request.schema), table);
    const std::string row_json = std::format("row_to_json({}.*)", table);

    ParamBinder binder;
    std::string sql;

    switch (op) {
        case Operation::SELECT: {
            std::string projection = row_json;
            if (!request.columns.empty()) {
                std::vector<std::string> pairs;
                pairs.reserve(request.columns.size());
                for (const auto& col : request.columns) {
                    pairs.push_back(std::format("'{}', {}", col, utils::quote_identifier(col)));
                }
                projection = std::format("json_build_object({})", join(pairs, ", "));
            }
            sql = std::format("SELECT {} AS data FROM {}", projection, stmt.target);
            sql += where_clause(using_pred, request.filters, binder);

            if (descriptor) {
                std::vector<std::string> keys;
                for (const auto* col : descriptor->primary_key()) {
                    keys.push_back(utils::quote_identifier(col->name));
                }
                if (!keys.empty()) {
                    sql += " ORDER BY " + join(keys, ", ");
                }
            }
            if (request.limit) {
                sql += " LIMIT " + binder.bind(TypedParam::int64(*request.limit));
            }
            if (request.offset) {
                sql += " OFFSET " + binder.bind(TypedParam::int64(*request.offset));
            }
            break;
        }

        case Operation::INSERT: {
            std::vector<std::string> columns;
            std::vector<std::string> placeholders;
            for (const auto& field : request.values) {
                columns.push_back(utils::quote_identifier(field.column));
                placeholders.push_back(binder.bind(field.param));
            }
            sql = std::format("INSERT INTO {} ({}) VALUES ({})",
                              stmt.target, join(columns, ", "), join(placeholders, ", "));
            sql += returning_clause(row_json, check_pred);
            stmt.has_check_guard = !check_pred.is_unrestricted();
            break;
        }

        case Operation::UPDATE: {
            std::vector<std::string> assignments;
            for (const auto& field : request.values) {
                assignments.push_back(std::format("{} = {}",
                    utils::quote_identifier(field.column), binder.bind(field.param)));
            }
            sql = std::format("UPDATE {} SET {}", stmt.target, join(assignments, ", "));
            sql += where_clause(using_pred, request.filters, binder);
            sql += returning_clause(row_json, check_pred);
            stmt.has_check_guard = !check_pred.is_unrestricted();
            break;
        }

        case Operation::DELETE:
            sql = std::format("DELETE FROM {}", stmt.target);
            sql += where_clause(using_pred, request.filters, binder);
            sql += returning_clause(row_json, Predicate::unrestricted());
            break;

        case Operation::ALL:
            return R::error(ErrorCategory::INVALID_PAYLOAD,
                            "Operation 'all' cannot be built into a statement");
    }

    stmt.sql = std::move(sql);
    stmt.params = binder.take();

    utils::log::debug(std::format("Built {} on {}: {} params{}",
        operation_to_string(op), stmt.target, stmt.params.size(),
        using_pred.is_deny() ? " (deny)" : ""));
    return R::ok(std::move(stmt));
}

Result<bool> QueryBuilder::validate(const BuildRequest& request, const TableDescriptor* descriptor) {
    using R = Result<bool>;
    const Operation op = request.operation;

    if (op == Operation::ALL) {
        return R::error(ErrorCategory::INVALID_PAYLOAD,
                        "Operation 'all' cannot be built into a statement");
    }

    if (!request.schema.empty() && !utils::is_simple_identifier(request.schema)) {
        return R::error(ErrorCategory::INVALID_COLUMN_SET,
                        std::format("Invalid schema name '{}'", request.schema));
    }
    if (!utils::is_simple_identifier(request.table)) {
        return R::error(ErrorCategory::INVALID_COLUMN_SET,
                        std::format("Invalid table name '{}'", request.table));
    }

    const bool is_write = op == Operation::INSERT || op == Operation::UPDATE;
    if (is_write && request.values.empty()) {
        return R::error(ErrorCategory::EMPTY_WRITE_SET,
            std::format("{} on '{}' has no columns to write", operation_to_string(op), request.table));
    }
    if (!is_write && !request.values.empty()) {
        return R::error(ErrorCategory::INVALID_PAYLOAD,
            std::format("{} does not take values", operation_to_string(op)));
    }
    if (op != Operation::SELECT &&
        (!request.columns.empty() || request.limit || request.offset)) {
        return R::error(ErrorCategory::INVALID_PAYLOAD,
            std::format("{} does not take a projection, limit or offset", operation_to_string(op)));
    }
    if (op == Operation::INSERT && !request.filters.empty()) {
        return R::error(ErrorCategory::INVALID_PAYLOAD, "insert does not take filters");
    }
    if ((request.limit && *request.limit < 0) || (request.offset && *request.offset < 0)) {
        return R::error(ErrorCategory::INVALID_PAYLOAD, "limit and offset must not be negative");
    }

    const auto check_column = [&](const std::string& name, bool written) -> R {
        if (!utils::is_simple_identifier(name)) {
            return R::error(ErrorCategory::INVALID_COLUMN_SET,
                            std::format("Invalid column name '{}'", name));
        }
        if (!descriptor) return R::ok(true);

        const auto* column = descriptor->find_column(name);
        if (!column) {
            return R::error(ErrorCategory::INVALID_COLUMN_SET,
                std::format("Unknown column '{}' in table '{}'", name, descriptor->qualified_name()));
        }
        if (written && column->is_generated()) {
            return R::error(ErrorCategory::INVALID_COLUMN_SET,
                std::format("Column '{}' is generated and cannot be written", name));
        }
        return R::ok(true);
    };

    std::unordered_set<std::string> assigned;
    for (const auto& field : request.values) {
        auto r = check_column(field.column, true);
        if (r.is_error()) return r;
        if (!assigned.insert(field.column).second) {
            return R::error(ErrorCategory::INVALID_COLUMN_SET,
                            std::format("Column '{}' assigned twice", field.column));
        }
    }
    for (const auto& field : request.filters) {
        auto r = check_column(field.column, false);
        if (r.is_error()) return r;
    }
    for (const auto& name : request.columns) {
        auto r = check_column(name, false);
        if (r.is_error()) return r;
    }

    return R::ok(true);
}

} // namespace tablegate
