#pragma once

#include "stablesql/config.hpp"
#include "stablesql/engine.hpp"
#include "stablesql/stable_io.hpp"
#include "stablesql/vfs.hpp"
#include <sqlite3.h>
#include <atomic>
#include <memory>
#include <mutex>

namespace stablesql::detail {

/// Locks `m`, reporting failure as synchronization_error.
std::unique_lock<std::mutex> acquire(std::mutex& m);

struct database_state {
    configuration config;
    std::shared_ptr<stable_io> io;
    std::unique_ptr<vfs> filesystem;

    // Shared by every connection of this database: the backing memory has no
    // protection of its own, so all engine access is serialized here.
    std::mutex engine_mutex;
};

struct connection_state {
    connection_state(std::shared_ptr<database_state> db, sqlite3* handle)
        : db(std::move(db)), handle(handle) {}
    /// Closes under the engine lock. Must not run on a thread that already
    /// holds it.
    ~connection_state();

    connection_state(const connection_state&) = delete;
    connection_state& operator=(const connection_state&) = delete;

    std::unique_lock<std::mutex> lock() { return acquire(db->engine_mutex); }
    stable_io& io() { return *db->io; }

    std::shared_ptr<database_state> db;
    sqlite3* handle;

    // Set while a checked transaction is open on this connection.
    std::atomic<bool> checked_transaction_open{false};
};

struct statement_state {
    statement_state(std::shared_ptr<connection_state> conn, const std::string& sql)
        : conn(std::move(conn)), stmt(std::make_unique<engine_statement>(this->conn->handle, sql)) {}
    /// Finalizes under the engine lock. Must not run on a thread that
    /// already holds it.
    ~statement_state();

    statement_state(const statement_state&) = delete;
    statement_state& operator=(const statement_state&) = delete;

    std::shared_ptr<connection_state> conn;
    std::unique_ptr<engine_statement> stmt;

    // Bumped by every query()/execute(); a rows cursor from an older run
    // reads as exhausted.
    uint64_t generation = 0;
};

} // namespace stablesql::detail
