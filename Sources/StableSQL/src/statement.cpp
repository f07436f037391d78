#include "stablesql/db.hpp"
#include "stablesql/log.hpp"
#include "db_state.hpp"

namespace stablesql {

// ============================================================================
// row
// ============================================================================

const value_t& row::get_value(size_t index) const {
    if (index >= values_.size()) {
        throw db_error("Column index " + std::to_string(index) + " out of range (row has " +
                       std::to_string(values_.size()) + " columns)");
    }
    return values_[index];
}

// ============================================================================
// rows
// ============================================================================

std::optional<row> rows::next() {
    if (exhausted_) {
        return std::nullopt;
    }
    auto lock = state_->conn->lock();
    if (state_->generation != generation_) {
        LOG_DEBUG("rows", "Statement was re-run; cursor exhausted");
        exhausted_ = true;
        return std::nullopt;
    }

    step_result r;
    try {
        r = step_until_settled(*state_->stmt, state_->conn->io());
    } catch (const execution_error&) {
        exhausted_ = true;
        throw;
    }

    switch (r) {
        case step_result::row: {
            int n = state_->stmt->column_count();
            std::vector<value_t> values;
            values.reserve(static_cast<size_t>(n));
            for (int i = 0; i < n; ++i) {
                values.push_back(state_->stmt->column_value(i));
            }
            return row(std::move(values));
        }
        case step_result::done:
            exhausted_ = true;
            return std::nullopt;
        case step_result::busy:
            exhausted_ = true;
            throw busy_error("Database is busy (SQL: " + state_->stmt->sql() + ")", SQLITE_BUSY);
        case step_result::interrupt:
            exhausted_ = true;
            throw interrupted_error("Interrupted (SQL: " + state_->stmt->sql() + ")", SQLITE_INTERRUPT);
        case step_result::io:
            break;
    }
    // step_until_settled never returns io
    throw db_error("Unexpected step result");
}

// ============================================================================
// statement
// ============================================================================

void statement::bind(const params_t& params) {
    auto& stmt = *state_->stmt;
    if (const auto* positional = std::get_if<positional_params>(&params)) {
        for (size_t i = 0; i < positional->size(); ++i) {
            stmt.bind_at(static_cast<int>(i + 1), (*positional)[i]);
        }
    } else if (const auto* named = std::get_if<named_params>(&params)) {
        for (const auto& [name, value] : *named) {
            auto index = stmt.parameter_index(name);
            if (!index) {
                LOG_ERROR("statement", "Unknown parameter %s (SQL: %s)", name.c_str(), stmt.sql().c_str());
                throw binding_error("Unknown parameter name: " + name);
            }
            stmt.bind_at(*index, value);
        }
    }
}

rows statement::query(const params_t& params) {
    auto lock = state_->conn->lock();
    state_->stmt->reset();
    ++state_->generation;
    bind(params);
    return rows(state_, state_->generation);
}

step_status statement::execute(const params_t& params) {
    auto lock = state_->conn->lock();
    state_->stmt->reset();
    ++state_->generation;
    bind(params);

    switch (step_until_settled(*state_->stmt, state_->conn->io())) {
        case step_result::row:
            LOG_WARN("statement", "Unexpected row during execute (SQL: %s)", state_->stmt->sql().c_str());
            state_->stmt->reset();
            return step_status::row;
        case step_result::done:
            return step_status::done;
        case step_result::busy:
            return step_status::busy;
        case step_result::interrupt:
            return step_status::interrupted;
        case step_result::io:
            break;
    }
    throw db_error("Unexpected step result");
}

std::vector<column> statement::columns() const {
    auto lock = state_->conn->lock();
    int n = state_->stmt->column_count();
    std::vector<column> cols;
    cols.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        cols.push_back(column{state_->stmt->column_name(i)});
    }
    return cols;
}

size_t statement::parameter_count() const {
    auto lock = state_->conn->lock();
    return static_cast<size_t>(state_->stmt->parameter_count());
}

} // namespace stablesql
