#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "context.hpp"
#include "memory.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stablesql {

namespace detail {
struct database_state;
struct connection_state;
struct statement_state;
}

class transaction;

// ============================================================================
// row - immutable snapshot of one result tuple
// ============================================================================

class row {
public:
    explicit row(std::vector<value_t> values) : values_(std::move(values)) {}

    /// Throws db_error if `index` is out of range.
    const value_t& get_value(size_t index) const;

    /// Typed access. Throws db_error on a range or type mismatch.
    template<typename T>
    T get(size_t index) const {
        const value_t& v = get_value(index);
        try {
            return detail::from_value<T>(v);
        } catch (const std::bad_variant_access&) {
            throw db_error("Column " + std::to_string(index) + " has a different type");
        }
    }

    bool is_null(size_t index) const {
        return std::holds_alternative<std::nullptr_t>(get_value(index));
    }

    size_t column_count() const { return values_.size(); }
    const std::vector<value_t>& values() const { return values_; }

private:
    std::vector<value_t> values_;
};

// ============================================================================
// rows - lazy, single-pass cursor over a statement's results
// ============================================================================

class rows {
public:
    /// Steps the statement until it yields a row or finishes. Returns
    /// nullopt once exhausted, and on every call after that.
    ///
    /// Throws busy_error / interrupted_error if the engine reports contention
    /// or interruption, execution_error on faults. The cursor is exhausted
    /// after any throw.
    std::optional<row> next();

private:
    friend class statement;
    rows(std::shared_ptr<detail::statement_state> state, uint64_t generation)
        : state_(std::move(state)), generation_(generation) {}

    std::shared_ptr<detail::statement_state> state_;
    uint64_t generation_;
    bool exhausted_ = false;
};

// ============================================================================
// statement - compiled query
// ============================================================================

class statement {
public:
    /// Resets, binds `params` and returns a cursor. Nothing is executed until
    /// the first rows::next(). Re-querying exhausts earlier cursors.
    rows query(const params_t& params = {});

    /// Resets, binds `params` and runs to completion. A row means the
    /// statement has a result set; it is discarded and step_status::row is
    /// returned. Throws execution_error on faults.
    step_status execute(const params_t& params = {});

    /// Result column names, in order.
    std::vector<column> columns() const;

    size_t parameter_count() const;

private:
    friend class connection;
    explicit statement(std::shared_ptr<detail::statement_state> state) : state_(std::move(state)) {}

    // Requires the engine lock.
    void bind(const params_t& params);

    std::shared_ptr<detail::statement_state> state_;
};

// ============================================================================
// connection
// ============================================================================

/// A connection to a database. Copies share the engine connection; every
/// method holds the database's engine lock for its own duration only.
class connection {
public:
    rows query(const std::string& sql, const params_t& params = {}) const;
    step_status execute(const std::string& sql, const params_t& params = {}) const;

    /// Throws execution_error if `sql` does not compile.
    statement prepare(const std::string& sql) const;

    /// Runs `PRAGMA <pragma>`, collects every row, then calls `fn` once per
    /// row in order. The lock is released before the first callback. An
    /// exception from `fn` stops the iteration and is rethrown as
    /// execution_error.
    void pragma_query(const std::string& pragma, const std::function<void(const row&)>& fn) const;

    /// Writes dirty pages to storage.
    void cacheflush() const;

    /// True if no explicit transaction is open.
    bool is_autocommit() const;

    /// Makes the running (or next) step on this connection report Interrupt.
    /// Does not take the engine lock; safe from any thread.
    void interrupt() const;

    /// Begin a transaction with the connection's default behavior
    /// (deferred unless changed). Throws db_error if a checked transaction
    /// is already open on this connection.
    stablesql::transaction transaction();

    stablesql::transaction transaction_with_behavior(transaction_behavior behavior);

    /// Begin a transaction without the open-transaction check; a nested
    /// BEGIN is rejected by the engine with execution_error.
    stablesql::transaction unchecked_transaction() const;

    /// Only applies to transaction() and unchecked_transaction().
    void set_transaction_behavior(transaction_behavior behavior) { behavior_ = behavior; }
    transaction_behavior get_transaction_behavior() const { return behavior_; }

private:
    friend class database;
    friend class stablesql::transaction;
    explicit connection(std::shared_ptr<detail::connection_state> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::connection_state> state_;
    transaction_behavior behavior_ = transaction_behavior::deferred;
};

// ============================================================================
// database / builder
// ============================================================================

class database {
public:
    /// Open a new engine connection over this database's memory.
    connection connect() const;

    const configuration& config() const;
    std::shared_ptr<virtual_memory> memory() const;

private:
    friend class builder;
    explicit database(std::shared_ptr<detail::database_state> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::database_state> state_;
};

/// Binds a database to a memory resource.
///
///     auto db = stablesql::builder::with_memory(std::make_shared<stablesql::heap_memory>()).build();
///     auto conn = db.connect();
///     conn.execute("CREATE TABLE IF NOT EXISTS users (email TEXT)");
class builder {
public:
    static builder with_memory(std::shared_ptr<virtual_memory> memory);

    builder& with_config(configuration config);
    builder& with_context(context ctx);

    /// Throws db_error on invalid configuration, execution_error if the
    /// engine cannot open the database.
    database build();

private:
    explicit builder(std::shared_ptr<virtual_memory> memory) : memory_(std::move(memory)) {}

    std::shared_ptr<virtual_memory> memory_;
    configuration config_;
    std::optional<context> context_;
};

} // namespace stablesql

#endif // __cplusplus
