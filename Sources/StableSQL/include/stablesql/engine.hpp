#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>

namespace stablesql {

/// Result of one engine step. Faults are thrown, not returned.
enum class step_result {
    row,        ///< A result row is available
    done,       ///< Statement ran to completion
    io,         ///< Storage work is pending; drive I/O and step again
    busy,
    interrupt
};

template<typename S>
concept steppable = requires(S& s) {
    { s.step() } -> std::same_as<step_result>;
};

template<typename IO>
concept io_driver = requires(IO& io) {
    io.run_once();
};

/// Steps until the engine reports anything other than pending I/O.
///
/// Pending I/O is where a caller would suspend on a latent backend. Here
/// every completion has already resolved by the time step() returns, so
/// driving run_once() and stepping again never blocks.
template<steppable S, io_driver IO>
step_result step_until_settled(S& stmt, IO& io) {
    for (;;) {
        step_result r = stmt.step();
        if (r != step_result::io) {
            return r;
        }
        io.run_once();
    }
}

// ============================================================================
// engine_statement - RAII over sqlite3_stmt
// ============================================================================

class engine_statement {
public:
    /// Compiles the first statement in `sql`. Throws execution_error on
    /// syntax or semantic errors.
    engine_statement(sqlite3* db, const std::string& sql);
    ~engine_statement();

    // Non-copyable
    engine_statement(const engine_statement&) = delete;
    engine_statement& operator=(const engine_statement&) = delete;

    /// SQLite completes its own I/O inside the VFS, so this never reports
    /// step_result::io. Throws execution_error on faults.
    step_result step();

    /// Clears bound values and rewinds the cursor.
    void reset();

    /// Binds by 1-based ordinal. Throws binding_error if the engine rejects
    /// the index or the value.
    void bind_at(int index, const value_t& value);

    /// Resolves a named parameter. `name` may omit its ':', '@' or '$' prefix.
    [[nodiscard]] std::optional<int> parameter_index(std::string_view name) const;

    [[nodiscard]] int parameter_count() const;
    [[nodiscard]] int column_count() const;
    [[nodiscard]] std::string column_name(int index) const;

    /// Deep copy of column `index` of the current row.
    [[nodiscard]] value_t column_value(int index) const;

    [[nodiscard]] const std::string& sql() const { return sql_; }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

} // namespace stablesql

#endif // __cplusplus
