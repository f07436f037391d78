#pragma once

#ifdef __cplusplus

#include "db.hpp"

namespace stablesql {

/// Represents a transaction on a database connection.
///
/// A transaction must be ended with commit(), rollback() or finish() before
/// it is destroyed; destroying an unfinished transaction aborts the process.
/// finish() applies the drop behavior, which defaults to rollback.
///
///     void perform_queries(stablesql::connection& conn) {
///         auto tx = conn.transaction();
///         tx.execute("INSERT INTO t VALUES (1)");
///         tx.commit();
///     }
class transaction {
public:
    /// Issues BEGIN. Refuses a second checked transaction on the connection
    /// with db_error.
    static transaction begin(connection& conn, transaction_behavior behavior);

    /// Issues BEGIN without the open-transaction check.
    static transaction begin_unchecked(const connection& conn, transaction_behavior behavior);

    transaction(transaction&& other) noexcept;
    transaction& operator=(transaction&&) = delete;
    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    ~transaction();

    stablesql::drop_behavior drop_behavior() const { return drop_behavior_; }
    void set_drop_behavior(stablesql::drop_behavior behavior) { drop_behavior_ = behavior; }

    transaction_state state() const { return state_; }

    void commit();
    void rollback();

    /// Ends the transaction according to drop_behavior(). Succeeds
    /// trivially if the engine already ended it.
    void finish();

    /// The transaction's own handle on the connection; stays valid after
    /// the caller's copy is gone.
    const connection& conn() const { return conn_; }
    const connection* operator->() const { return &conn_; }

    step_status execute(const std::string& sql, const params_t& params = {}) const {
        return conn_.execute(sql, params);
    }
    rows query(const std::string& sql, const params_t& params = {}) const {
        return conn_.query(sql, params);
    }
    statement prepare(const std::string& sql) const {
        return conn_.prepare(sql);
    }

private:
    transaction(const connection& conn, bool checked) : conn_(conn), holds_check_(checked) {}

    static transaction start(const connection& conn, transaction_behavior behavior, bool checked);

    void ensure_active(const char* op) const;
    void do_commit();
    void do_rollback();
    void run_control(const char* sql);
    void release_check();

    connection conn_;
    stablesql::drop_behavior drop_behavior_ = stablesql::drop_behavior::rollback;
    transaction_state state_ = transaction_state::active;
    bool must_finish_ = true;
    bool holds_check_;
};

} // namespace stablesql

#endif // __cplusplus
