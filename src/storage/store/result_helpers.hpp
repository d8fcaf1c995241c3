#pragma once

/**
 * @file result_helpers.hpp
 * @brief Early-return macros and conversions for Result<T>
 */

#include <optional>
#include <utility>
#include <corpusdb/core/types.h>

namespace corpusdb::storage::detail {

/**
 * @def CORPUSDB_TRY(expr)
 * @brief Evaluate expression and return early if it's an error
 *
 * @code
 * Result<void> purge(Database& db, RowId sid) {
 *     CORPUSDB_TRY(deleteLinks(db, sid));
 *     CORPUSDB_TRY(deleteTags(db, sid));
 *     return {};
 * }
 * @endcode
 */
#define CORPUSDB_TRY(expr)                                                                         \
    do {                                                                                           \
        auto _corpusdb_try_result = (expr);                                                        \
        if (!_corpusdb_try_result.has_value()) {                                                   \
            return _corpusdb_try_result.error();                                                   \
        }                                                                                          \
    } while (0)

/**
 * @def CORPUSDB_TRY_UNWRAP(var, expr)
 * @brief Declare var from the value of a Result, returning its error if failed
 *
 * @code
 * CORPUSDB_TRY_UNWRAP(stmt, db.prepare(sql));
 * CORPUSDB_TRY_UNWRAP(hasRow, stmt.step());
 * @endcode
 */
#define CORPUSDB_TRY_UNWRAP(var, expr)                                                             \
    auto _corpusdb_res_##var = (expr);                                                             \
    if (!_corpusdb_res_##var.has_value()) {                                                        \
        return _corpusdb_res_##var.error();                                                        \
    }                                                                                              \
    auto var = std::move(_corpusdb_res_##var).value()

/**
 * @brief Convert optional<T> to Result<T>, with error if empty
 */
template <typename T> Result<T> from_optional(std::optional<T>&& opt, Error error) {
    if (opt.has_value()) {
        return std::move(opt).value();
    }
    return error;
}

} // namespace corpusdb::storage::detail
