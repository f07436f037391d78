#include "stablesql/engine.hpp"
#include "stablesql/log.hpp"
#include <cctype>

namespace stablesql {

engine_statement::engine_statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("engine", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw execution_error("Failed to prepare statement: " + error, sqlite3_extended_errcode(db_));
    }
    if (!stmt_) {
        throw execution_error("Empty statement (SQL: " + sql + ")", SQLITE_MISUSE);
    }
    if (tail) {
        while (*tail && std::isspace(static_cast<unsigned char>(*tail))) ++tail;
        if (*tail) {
            LOG_WARN("engine", "Ignoring trailing SQL after first statement: %s", tail);
        }
    }
}

engine_statement::~engine_statement() {
    sqlite3_finalize(stmt_);
}

step_result engine_statement::step() {
    int rc = sqlite3_step(stmt_);
    // Extended codes are enabled; classify on the primary code
    switch (rc & 0xFF) {
        case SQLITE_ROW: return step_result::row;
        case SQLITE_DONE: return step_result::done;
        case SQLITE_BUSY:
        case SQLITE_LOCKED: return step_result::busy;
        case SQLITE_INTERRUPT: return step_result::interrupt;
        default: {
            std::string error = sqlite3_errmsg(db_);
            int code = sqlite3_extended_errcode(db_);
            LOG_ERROR("engine", "Step failed: %s (SQL: %s)", error.c_str(), sql_.c_str());
            throw execution_error("SQL execution failure: " + error, code);
        }
    }
}

void engine_statement::reset() {
    // sqlite3_reset repeats the error of the last step, which was already
    // reported by step().
    int rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
        LOG_DEBUG("engine", "Reset after failed step (rc=%d)", rc);
    }
    sqlite3_clear_bindings(stmt_);
}

void engine_statement::bind_at(int index, const value_t& value) {
    int rc = std::visit([&](auto&& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt_, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text64(stmt_, index, v.data(), v.size(), SQLITE_TRANSIENT, SQLITE_UTF8);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                return sqlite3_bind_zeroblob(stmt_, index, 0);
            }
            return sqlite3_bind_blob64(stmt_, index, v.data(), v.size(), SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        std::string error = rc == SQLITE_RANGE
            ? "parameter index " + std::to_string(index) + " out of range (statement has " +
                  std::to_string(parameter_count()) + ")"
            : std::string(sqlite3_errstr(rc));
        LOG_ERROR("engine", "Bind failed: %s (SQL: %s)", error.c_str(), sql_.c_str());
        throw binding_error("Failed to bind parameter: " + error);
    }
}

std::optional<int> engine_statement::parameter_index(std::string_view name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    std::string key(name);
    if (name[0] == ':' || name[0] == '@' || name[0] == '$' || name[0] == '?') {
        int idx = sqlite3_bind_parameter_index(stmt_, key.c_str());
        if (idx > 0) return idx;
        return std::nullopt;
    }
    for (char prefix : {':', '@', '$'}) {
        std::string prefixed = prefix + key;
        int idx = sqlite3_bind_parameter_index(stmt_, prefixed.c_str());
        if (idx > 0) return idx;
    }
    return std::nullopt;
}

int engine_statement::parameter_count() const {
    return sqlite3_bind_parameter_count(stmt_);
}

int engine_statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

std::string engine_statement::column_name(int index) const {
    const char* name = sqlite3_column_name(stmt_, index);
    return name ? name : "";
}

value_t engine_statement::column_value(int index) const {
    switch (sqlite3_column_type(stmt_, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
            int size = sqlite3_column_bytes(stmt_, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_BLOB: {
            const auto* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
            int size = sqlite3_column_bytes(stmt_, index);
            if (!bytes) return std::vector<uint8_t>{};
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

} // namespace stablesql
