#pragma once

#include "core/typed_param.hpp"
#include "policy/policy_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief A parameterized statement ready for execution
 *
 * Every statement produces a single "data" column holding one JSON document
 * per row. When has_check_guard is set the statement also returns a
 * "check_passed" boolean per written row; the executor must roll back if
 * any row reports false.
 */
struct Statement {
    std::string sql;
    std::vector<TypedParam> params;     // Bound as $1..$n
    Operation operation = Operation::SELECT;
    std::string target;                 // Quoted "schema"."table"
    bool has_check_guard = false;
};

/**
 * @brief Input to QueryBuilder::build
 *
 * columns: select projection (empty = all columns)
 * values:  insert/update assignments
 * filters: equality predicates for select/update/delete; a NULL value
 *          matches with IS NULL
 */
struct BuildRequest {
    std::string schema;
    std::string table;
    Operation operation = Operation::SELECT;
    std::vector<std::string> columns;
    std::vector<FieldValue> values;
    std::vector<FieldValue> filters;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

} // namespace tablegate
