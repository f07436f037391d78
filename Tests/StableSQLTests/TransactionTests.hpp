#pragma once

#include <StableSQL.hpp>
#include <cassert>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace transaction_tests {

inline stablesql::connection fresh_connection() {
    auto db = stablesql::builder::with_memory(std::make_shared<stablesql::heap_memory>()).build();
    auto conn = db.connect();
    conn.execute("CREATE TABLE foo (x INTEGER)");
    return conn;
}

inline int64_t sum_foo(const stablesql::connection& conn) {
    auto rs = conn.query("SELECT COALESCE(SUM(x), 0) FROM foo");
    return rs.next()->get<int64_t>(0);
}

inline stablesql::database database_with_foo() {
    auto db = stablesql::builder::with_memory(std::make_shared<stablesql::heap_memory>()).build();
    db.connect().execute("CREATE TABLE foo (x INTEGER)");
    return db;
}

// The connection that began the transaction goes away on return.
inline stablesql::transaction begin_on_own_connection(const stablesql::database& db) {
    auto conn = db.connect();
    return conn.transaction_with_behavior(stablesql::transaction_behavior::immediate);
}

// Runs `fn` in a child process and reports whether it died of SIGABRT.
template<typename Fn>
bool aborts(Fn&& fn) {
    std::cout << std::flush;
    pid_t pid = fork();
    if (pid == 0) {
        try {
            fn();
        } catch (const std::exception&) {
            _exit(2);
        }
        _exit(0);
    }
    assert(pid > 0);
    int status = 0;
    waitpid(pid, &status, 0);
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

// ============================================================================
// test_commit - IMMEDIATE transaction, visible after commit
// ============================================================================

void test_commit() {
    std::cout << "  test_commit..." << std::flush;

    auto conn = fresh_connection();
    {
        auto tx = conn.transaction_with_behavior(stablesql::transaction_behavior::immediate);
        assert(!conn.is_autocommit());
        assert(tx.state() == stablesql::transaction_state::active);
        tx.execute("INSERT INTO foo VALUES (?1)", stablesql::params_of(4));
        tx.commit();
        assert(tx.state() == stablesql::transaction_state::committed);
    }
    assert(conn.is_autocommit());
    assert(sum_foo(conn) == 4);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_rollback - changes discarded
// ============================================================================

void test_rollback() {
    std::cout << "  test_rollback..." << std::flush;

    auto conn = fresh_connection();
    conn.execute("INSERT INTO foo VALUES (1)");
    {
        auto tx = conn.transaction();
        tx.execute("INSERT INTO foo VALUES (2)");
        assert(sum_foo(conn) == 3);
        tx.rollback();
        assert(tx.state() == stablesql::transaction_state::rolled_back);
    }
    assert(conn.is_autocommit());
    assert(sum_foo(conn) == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_finish_policies - rollback (default), commit, ignore
// ============================================================================

void test_finish_policies() {
    std::cout << "  test_finish_policies..." << std::flush;

    auto conn = fresh_connection();
    {
        auto tx = conn.transaction();
        assert(tx.drop_behavior() == stablesql::drop_behavior::rollback);
        tx.execute("INSERT INTO foo VALUES (1)");
        tx.finish();
        assert(tx.state() == stablesql::transaction_state::rolled_back);
    }
    assert(sum_foo(conn) == 0);

    {
        auto tx = conn.transaction();
        tx.set_drop_behavior(stablesql::drop_behavior::commit);
        tx.execute("INSERT INTO foo VALUES (2)");
        tx.finish();
        assert(tx.state() == stablesql::transaction_state::committed);
    }
    assert(sum_foo(conn) == 2);

    {
        auto tx = conn.transaction();
        tx.set_drop_behavior(stablesql::drop_behavior::ignore);
        tx.execute("INSERT INTO foo VALUES (3)");
        tx.finish();
        assert(tx.state() == stablesql::transaction_state::ignored);
    }
    // Still open; the caller owns it now
    assert(!conn.is_autocommit());
    assert(conn.execute("COMMIT") == stablesql::step_status::done);
    assert(sum_foo(conn) == 5);

    // The check was released, so a new checked transaction may begin
    auto tx = conn.transaction();
    tx.rollback();

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_finish_after_engine_ended - nothing left to do
// ============================================================================

void test_finish_after_engine_ended() {
    std::cout << "  test_finish_after_engine_ended..." << std::flush;

    auto conn = fresh_connection();
    auto tx = conn.unchecked_transaction();
    tx.execute("INSERT INTO foo VALUES (7)");
    conn.execute("COMMIT");
    assert(conn.is_autocommit());

    tx.set_drop_behavior(stablesql::drop_behavior::panic);
    tx.finish();
    assert(tx.state() == stablesql::transaction_state::closed);
    assert(sum_foo(conn) == 7);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_terminal_states - a finished transaction refuses further use
// ============================================================================

void test_terminal_states() {
    std::cout << "  test_terminal_states..." << std::flush;

    auto conn = fresh_connection();
    auto tx = conn.transaction();
    tx.commit();

    bool threw = false;
    try {
        tx.commit();
    } catch (const stablesql::db_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tx.finish();
    } catch (const stablesql::db_error&) {
        threw = true;
    }
    assert(threw);
    assert(tx.state() == stablesql::transaction_state::committed);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_checked_refuses_nesting - one checked transaction per connection
// ============================================================================

void test_checked_refuses_nesting() {
    std::cout << "  test_checked_refuses_nesting..." << std::flush;

    auto conn = fresh_connection();
    auto outer = conn.transaction();

    bool refused = false;
    try {
        auto inner = conn.transaction();
        inner.rollback();
    } catch (const stablesql::execution_error&) {
        assert(false && "refusal must happen before BEGIN reaches the engine");
    } catch (const stablesql::db_error&) {
        refused = true;
    }
    assert(refused);

    outer.rollback();
    auto again = conn.transaction();
    again.execute("INSERT INTO foo VALUES (1)");
    again.commit();
    assert(sum_foo(conn) == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unchecked_nesting_rejected_by_engine
// ============================================================================

void test_unchecked_nesting_rejected_by_engine() {
    std::cout << "  test_unchecked_nesting_rejected_by_engine..." << std::flush;

    auto conn = fresh_connection();
    auto outer = conn.unchecked_transaction();

    bool threw = false;
    try {
        auto inner = conn.unchecked_transaction();
        inner.rollback();
    } catch (const stablesql::execution_error&) {
        threw = true;
    }
    assert(threw);

    // The outer transaction is unaffected
    assert(outer.state() == stablesql::transaction_state::active);
    assert(!conn.is_autocommit());
    outer.rollback();
    assert(conn.is_autocommit());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_behaviors - every BEGIN mode, connection default
// ============================================================================

void test_behaviors() {
    std::cout << "  test_behaviors..." << std::flush;

    auto conn = fresh_connection();
    assert(conn.get_transaction_behavior() == stablesql::transaction_behavior::deferred);

    for (auto behavior : {stablesql::transaction_behavior::deferred,
                          stablesql::transaction_behavior::immediate,
                          stablesql::transaction_behavior::exclusive}) {
        auto tx = conn.transaction_with_behavior(behavior);
        tx.execute("INSERT INTO foo VALUES (1)");
        tx.commit();
    }
    assert(sum_foo(conn) == 3);

    conn.set_transaction_behavior(stablesql::transaction_behavior::exclusive);
    assert(conn.get_transaction_behavior() == stablesql::transaction_behavior::exclusive);
    auto tx = conn.unchecked_transaction();
    tx.rollback();

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_forwarding_and_move - a transaction acts as its connection
// ============================================================================

void test_forwarding_and_move() {
    std::cout << "  test_forwarding_and_move..." << std::flush;

    auto conn = fresh_connection();
    auto tx = conn.transaction();
    assert(!tx->is_autocommit());

    auto insert = tx.prepare("INSERT INTO foo VALUES (?1)");
    insert.execute(stablesql::params_of(10));
    insert.execute(stablesql::params_of(20));

    {
        auto rs = tx.query("SELECT x FROM foo ORDER BY x");
        assert(rs.next()->get<int64_t>(0) == 10);
    }

    auto moved = std::move(tx);
    assert(moved.state() == stablesql::transaction_state::active);
    assert(!moved.conn().is_autocommit());
    moved.commit();
    assert(sum_foo(conn) == 30);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_second_writer_busy - one write transaction per database
// ============================================================================

void test_second_writer_busy() {
    std::cout << "  test_second_writer_busy..." << std::flush;

    auto db = database_with_foo();
    auto a = db.connect();
    auto b = db.connect();

    auto first = a.transaction_with_behavior(stablesql::transaction_behavior::immediate);
    first.execute("INSERT INTO foo VALUES (1)");

    bool busy = false;
    try {
        auto second = b.transaction_with_behavior(stablesql::transaction_behavior::immediate);
        second.rollback();
    } catch (const stablesql::busy_error& e) {
        busy = true;
        assert(e.code() == SQLITE_BUSY);
    }
    assert(busy);
    assert(b.is_autocommit());

    // A plain write outside a transaction is refused the same way
    assert(b.execute("INSERT INTO foo VALUES (100)") == stablesql::step_status::busy);

    first.commit();

    // The check on `b` was released by the failed BEGIN
    auto second = b.transaction_with_behavior(stablesql::transaction_behavior::immediate);
    second.execute("INSERT INTO foo VALUES (2)");
    second.commit();

    assert(sum_foo(a) == 3);
    assert(sum_foo(b) == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_commit_waits_for_reader - an open cursor holds off a commit
// ============================================================================

void test_commit_waits_for_reader() {
    std::cout << "  test_commit_waits_for_reader..." << std::flush;

    auto db = database_with_foo();
    auto writer = db.connect();
    auto reader = db.connect();
    writer.execute("INSERT INTO foo VALUES (1)");
    writer.execute("INSERT INTO foo VALUES (2)");

    auto tx = writer.transaction();
    tx.execute("INSERT INTO foo VALUES (4)");
    {
        auto rs = reader.query("SELECT x FROM foo ORDER BY x");
        assert(rs.next()->get<int64_t>(0) == 1);

        bool busy = false;
        try {
            tx.commit();
        } catch (const stablesql::busy_error&) {
            busy = true;
        }
        assert(busy);
        assert(tx.state() == stablesql::transaction_state::active);

        // The reader still sees the committed snapshot
        assert(rs.next()->get<int64_t>(0) == 2);
        assert(!rs.next().has_value());
    }

    tx.commit();
    assert(tx.state() == stablesql::transaction_state::committed);
    assert(sum_foo(reader) == 7);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_returned_transaction - outlives the connection handle that began it
// ============================================================================

void test_returned_transaction() {
    std::cout << "  test_returned_transaction..." << std::flush;

    auto db = database_with_foo();
    auto tx = begin_on_own_connection(db);
    assert(tx.state() == stablesql::transaction_state::active);
    assert(!tx->is_autocommit());
    tx.execute("INSERT INTO foo VALUES (?1)", stablesql::params_of(9));
    tx.commit();
    assert(tx.conn().is_autocommit());

    assert(sum_foo(db.connect()) == 9);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unfinished_transaction_aborts - destructor and panic policy
// ============================================================================

void test_unfinished_transaction_aborts() {
    std::cout << "  test_unfinished_transaction_aborts..." << std::flush;

    stablesql::configuration quiet;
    quiet.level = stablesql::log_level::off;

    assert(aborts([&] {
        auto db = stablesql::builder::with_memory(std::make_shared<stablesql::heap_memory>())
                      .with_config(quiet).build();
        auto conn = db.connect();
        auto tx = conn.transaction();
    }));

    assert(aborts([&] {
        auto db = stablesql::builder::with_memory(std::make_shared<stablesql::heap_memory>())
                      .with_config(quiet).build();
        auto conn = db.connect();
        auto tx = conn.transaction();
        tx.set_drop_behavior(stablesql::drop_behavior::panic);
        tx.finish();
    }));

    // Finished transactions exit cleanly
    assert(!aborts([&] {
        auto db = stablesql::builder::with_memory(std::make_shared<stablesql::heap_memory>())
                      .with_config(quiet).build();
        auto conn = db.connect();
        auto tx = conn.transaction();
        tx.finish();
    }));

    std::cout << " OK" << std::endl;
}

inline void run_all() {
    std::cout << "Testing transactions..." << std::endl;
    test_commit();
    test_rollback();
    test_finish_policies();
    test_finish_after_engine_ended();
    test_terminal_states();
    test_checked_refuses_nesting();
    test_unchecked_nesting_rejected_by_engine();
    test_behaviors();
    test_forwarding_and_move();
    test_second_writer_busy();
    test_commit_waits_for_reader();
    test_returned_transaction();
    test_unfinished_transaction_aborts();
}

} // namespace transaction_tests
