#include "stablesql/db.hpp"
#include "stablesql/transaction.hpp"
#include "stablesql/log.hpp"
#include "db_state.hpp"
#include <system_error>

namespace stablesql {

namespace detail {

std::unique_lock<std::mutex> acquire(std::mutex& m) {
    try {
        return std::unique_lock<std::mutex>(m);
    } catch (const std::system_error& e) {
        LOG_ERROR("db", "Failed to acquire engine lock: %s", e.what());
        throw synchronization_error("Mutex lock error: " + std::string(e.what()));
    }
}

namespace {

// Closing and finalizing can write to the shared memory (a close rolls back
// an open transaction), so teardown takes the engine lock as well.
std::unique_lock<std::mutex> teardown_lock(std::mutex& m, const char* what) {
    try {
        return acquire(m);
    } catch (const synchronization_error& e) {
        LOG_ERROR("db", "%s without the engine lock: %s", what, e.what());
        return {};
    }
}

} // namespace

connection_state::~connection_state() {
    if (handle) {
        auto lock = teardown_lock(db->engine_mutex, "Closing connection");
        sqlite3_close_v2(handle);
    }
}

statement_state::~statement_state() {
    auto lock = teardown_lock(conn->db->engine_mutex, "Finalizing statement");
    stmt.reset();
}

} // namespace detail

namespace {

// Runs a statement whose rows, if any, are not needed (pragma setters).
void run_to_completion(detail::connection_state& conn, const std::string& sql) {
    engine_statement stmt(conn.handle, sql);
    for (;;) {
        step_result r = step_until_settled(stmt, conn.io());
        if (r == step_result::done) {
            return;
        }
        if (r == step_result::busy) {
            throw busy_error("Database is busy (SQL: " + sql + ")", SQLITE_BUSY);
        }
        if (r == step_result::interrupt) {
            throw interrupted_error("Interrupted (SQL: " + sql + ")", SQLITE_INTERRUPT);
        }
    }
}

std::shared_ptr<detail::connection_state> open_connection(const std::shared_ptr<detail::database_state>& db) {
    sqlite3* handle = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(db->config.path.c_str(), &handle, flags, db->filesystem->name().c_str());
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw execution_error("Failed to open database: " + error, rc);
    }
    sqlite3_extended_result_codes(handle, 1);

    auto conn = std::make_shared<detail::connection_state>(db, handle);
    auto lock = conn->lock();
    run_to_completion(*conn, "PRAGMA journal_mode = " + db->config.journal_mode);
    run_to_completion(*conn, "PRAGMA cache_size = " + std::to_string(db->config.cache_size));
    return conn;
}

} // namespace

// ============================================================================
// builder
// ============================================================================

builder builder::with_memory(std::shared_ptr<virtual_memory> memory) {
    if (!memory) {
        throw db_error("builder requires a memory resource");
    }
    return builder(std::move(memory));
}

builder& builder::with_config(configuration config) {
    config_ = std::move(config);
    return *this;
}

builder& builder::with_context(context ctx) {
    context_ = std::move(ctx);
    return *this;
}

database builder::build() {
    config_.validate();
    set_log_level(config_.level);

    auto state = std::make_shared<detail::database_state>();
    state->config = config_;
    state->io = std::make_shared<stable_io>(memory_, context_ ? *context_ : context::system());
    state->filesystem = std::make_unique<vfs>(state->io);

    bool fresh = memory_->size() == 0;
    auto bootstrap = open_connection(state);
    {
        auto lock = bootstrap->lock();
        if (fresh) {
            // The page size only sticks once page 1 exists, so materialize it
            // while this connection still carries the setting.
            run_to_completion(*bootstrap, "PRAGMA page_size = " + std::to_string(config_.page_size));
            run_to_completion(*bootstrap, "PRAGMA user_version = 0");
        }
        engine_statement check(bootstrap->handle, "PRAGMA page_size");
        if (step_until_settled(check, *state->io) == step_result::row) {
            auto page_size = std::get<int64_t>(check.column_value(0));
            if (page_size != config_.page_size) {
                LOG_INFO("db", "Existing database keeps page size %lld (configured %u)",
                         (long long)page_size, config_.page_size);
            }
        }
    }
    LOG_INFO("db", "Opened %s over %llu units of memory (%s)", config_.path.c_str(),
             (unsigned long long)memory_->size(), fresh ? "new" : "existing");
    return database(std::move(state));
}

// ============================================================================
// database
// ============================================================================

connection database::connect() const {
    return connection(open_connection(state_));
}

const configuration& database::config() const {
    return state_->config;
}

std::shared_ptr<virtual_memory> database::memory() const {
    return state_->io->memory();
}

// ============================================================================
// connection
// ============================================================================

rows connection::query(const std::string& sql, const params_t& params) const {
    auto stmt = prepare(sql);
    return stmt.query(params);
}

step_status connection::execute(const std::string& sql, const params_t& params) const {
    auto stmt = prepare(sql);
    return stmt.execute(params);
}

statement connection::prepare(const std::string& sql) const {
    auto lock = state_->lock();
    return statement(std::make_shared<detail::statement_state>(state_, sql));
}

void connection::pragma_query(const std::string& pragma, const std::function<void(const row&)>& fn) const {
    std::vector<row> results;
    {
        auto lock = state_->lock();
        engine_statement stmt(state_->handle, "PRAGMA " + pragma);
        int n = stmt.column_count();
        for (;;) {
            step_result r = step_until_settled(stmt, state_->io());
            if (r == step_result::done) {
                break;
            }
            if (r == step_result::busy) {
                throw busy_error("Database is busy (PRAGMA " + pragma + ")", SQLITE_BUSY);
            }
            if (r == step_result::interrupt) {
                throw interrupted_error("Interrupted (PRAGMA " + pragma + ")", SQLITE_INTERRUPT);
            }
            std::vector<value_t> values;
            values.reserve(static_cast<size_t>(n));
            for (int i = 0; i < n; ++i) {
                values.push_back(stmt.column_value(i));
            }
            results.emplace_back(std::move(values));
        }
    }

    for (const auto& r : results) {
        try {
            fn(r);
        } catch (const std::exception& e) {
            LOG_ERROR("db", "pragma_query callback failed: %s", e.what());
            throw execution_error("Error executing user defined function: " + std::string(e.what()),
                                  SQLITE_ABORT);
        }
    }
}

void connection::cacheflush() const {
    auto lock = state_->lock();
    int rc = sqlite3_db_cacheflush(state_->handle);
    if ((rc & 0xFF) == SQLITE_BUSY) {
        throw busy_error("Cache flush failed: database is busy", rc);
    }
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(state_->handle);
        LOG_ERROR("db", "Cache flush failed: %s", error.c_str());
        throw execution_error("Cache flush failed: " + error, rc);
    }
}

bool connection::is_autocommit() const {
    auto lock = state_->lock();
    return sqlite3_get_autocommit(state_->handle) != 0;
}

void connection::interrupt() const {
    sqlite3_interrupt(state_->handle);
}

stablesql::transaction connection::transaction() {
    return stablesql::transaction::begin(*this, behavior_);
}

stablesql::transaction connection::transaction_with_behavior(transaction_behavior behavior) {
    return stablesql::transaction::begin(*this, behavior);
}

stablesql::transaction connection::unchecked_transaction() const {
    return stablesql::transaction::begin_unchecked(*this, behavior_);
}

} // namespace stablesql
