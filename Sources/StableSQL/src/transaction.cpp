#include "stablesql/transaction.hpp"
#include "stablesql/log.hpp"
#include "db_state.hpp"
#include <cstdlib>

namespace stablesql {

namespace {

const char* begin_sql(transaction_behavior behavior) {
    switch (behavior) {
        case transaction_behavior::deferred: return "BEGIN DEFERRED";
        case transaction_behavior::immediate: return "BEGIN IMMEDIATE";
        case transaction_behavior::exclusive: return "BEGIN EXCLUSIVE";
    }
    return "BEGIN";
}

} // namespace

transaction transaction::begin(connection& conn, transaction_behavior behavior) {
    bool expected = false;
    if (!conn.state_->checked_transaction_open.compare_exchange_strong(expected, true)) {
        throw db_error("A transaction is already open on this connection");
    }
    return start(conn, behavior, true);
}

transaction transaction::begin_unchecked(const connection& conn, transaction_behavior behavior) {
    return start(conn, behavior, false);
}

transaction transaction::start(const connection& conn, transaction_behavior behavior, bool checked) {
    transaction tx(conn, checked);
    try {
        tx.run_control(begin_sql(behavior));
    } catch (const db_error&) {
        tx.must_finish_ = false;
        tx.release_check();
        throw;
    }
    LOG_DEBUG("transaction", "%s", begin_sql(behavior));
    return tx;
}

transaction::transaction(transaction&& other) noexcept
    : conn_(other.conn_)
    , drop_behavior_(other.drop_behavior_)
    , state_(other.state_)
    , must_finish_(other.must_finish_)
    , holds_check_(other.holds_check_)
{
    other.must_finish_ = false;
    other.holds_check_ = false;
}

transaction::~transaction() {
    if (must_finish_) {
        LOG_ERROR("transaction", "Transaction dropped without finish()");
        std::abort();
    }
    release_check();
}

void transaction::commit() {
    ensure_active("commit");
    do_commit();
}

void transaction::rollback() {
    ensure_active("rollback");
    do_rollback();
}

void transaction::finish() {
    ensure_active("finish");
    if (conn_.is_autocommit()) {
        // The engine already ended it, e.g. an error-triggered rollback
        must_finish_ = false;
        state_ = transaction_state::closed;
        release_check();
        return;
    }
    switch (drop_behavior_) {
        case stablesql::drop_behavior::commit:
            try {
                do_commit();
            } catch (const execution_error& e) {
                LOG_WARN("transaction", "Commit failed, rolling back: %s", e.what());
                do_rollback();
            }
            break;
        case stablesql::drop_behavior::rollback:
            do_rollback();
            break;
        case stablesql::drop_behavior::ignore:
            must_finish_ = false;
            state_ = transaction_state::ignored;
            release_check();
            break;
        case stablesql::drop_behavior::panic:
            LOG_ERROR("transaction", "Transaction dropped unexpectedly.");
            std::abort();
    }
}

void transaction::ensure_active(const char* op) const {
    if (state_ != transaction_state::active) {
        throw db_error(std::string("Cannot ") + op + " a transaction that is no longer active");
    }
}

void transaction::do_commit() {
    // Cleared first so a failing COMMIT does not trip the destructor.
    must_finish_ = false;
    run_control("COMMIT");
    state_ = transaction_state::committed;
    release_check();
}

void transaction::do_rollback() {
    must_finish_ = false;
    run_control("ROLLBACK");
    state_ = transaction_state::rolled_back;
    release_check();
}

void transaction::run_control(const char* sql) {
    step_status status = conn_.execute(sql);
    switch (status) {
        case step_status::done:
            return;
        case step_status::busy:
            throw busy_error(std::string(sql) + " failed: database is busy", SQLITE_BUSY);
        case step_status::interrupted:
            throw interrupted_error(std::string(sql) + " failed: interrupted", SQLITE_INTERRUPT);
        case step_status::row:
            break;
    }
    throw execution_error(std::string(sql) + " returned a row", SQLITE_MISUSE);
}

void transaction::release_check() {
    if (holds_check_) {
        conn_.state_->checked_transaction_open.store(false);
        holds_check_ = false;
    }
}

} // namespace stablesql
