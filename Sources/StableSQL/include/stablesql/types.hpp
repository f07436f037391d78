#pragma once

#ifdef __cplusplus

#include "error.hpp"
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace stablesql {

// Supported SQL values: NULL, INTEGER, REAL, TEXT, BLOB
using value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Parameters: bound by 1-based position, or by name against the compiled
// statement's parameter table.
using positional_params = std::vector<value_t>;
using named_params = std::vector<std::pair<std::string, value_t>>;
using params_t = std::variant<std::monostate, positional_params, named_params>;

/// Outcome of statement::execute() when the engine did not fault.
enum class step_status {
    done,         ///< Ran to completion
    row,          ///< Produced a row; execute() expects none
    busy,         ///< Database busy, retry later
    interrupted   ///< Interrupted via connection::interrupt()
};

inline const char* to_string(step_status s) {
    switch (s) {
        case step_status::done: return "done";
        case step_status::row: return "row";
        case step_status::busy: return "busy";
        case step_status::interrupted: return "interrupted";
    }
    return "unknown";
}

/// BEGIN mode of a transaction.
enum class transaction_behavior {
    /// The transaction does not actually start until the database is first
    /// accessed.
    deferred,
    /// Start a write transaction immediately, without waiting for a write
    /// statement.
    immediate,
    /// Prevent other connections from reading the database while the
    /// transaction is underway.
    exclusive
};

/// What transaction::finish() does with a still-open transaction.
enum class drop_behavior {
    rollback,  ///< Roll back the changes. This is the default.
    commit,    ///< Commit, falling back to rollback if the commit fails.
    ignore,    ///< Leave the transaction open; the caller takes over.
    panic      ///< Abort the process. A development-time guard.
};

enum class transaction_state {
    active,
    committed,
    rolled_back,
    ignored,
    closed      ///< The engine already ended it (e.g. rollback on error)
};

/// Column information.
struct column {
    std::string name;
};

// ============================================================================
// Conversions to value_t
// ============================================================================

inline value_t to_value(std::nullptr_t) { return nullptr; }
inline value_t to_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }

template<std::integral T>
    requires (!std::same_as<T, bool>)
value_t to_value(T v) {
    if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
        if (v > static_cast<T>(std::numeric_limits<int64_t>::max())) {
            throw binding_error("Unsigned value " + std::to_string(v) + " does not fit in INTEGER");
        }
    }
    return static_cast<int64_t>(v);
}

template<std::floating_point T>
value_t to_value(T v) { return static_cast<double>(v); }

inline value_t to_value(const char* v) { return std::string(v); }
inline value_t to_value(std::string_view v) { return std::string(v); }
inline value_t to_value(std::string v) { return v; }
inline value_t to_value(std::vector<uint8_t> v) { return v; }
inline value_t to_value(value_t v) { return v; }

template<typename T>
value_t to_value(const std::optional<T>& v) {
    if (!v.has_value()) return nullptr;
    return to_value(*v);
}

/// Positional parameters from heterogeneous arguments:
///     conn.execute("INSERT INTO t VALUES (?1, ?2)", params_of(1, "a"));
template<typename... Args>
positional_params params_of(Args&&... args) {
    return positional_params{to_value(std::forward<Args>(args))...};
}

/// Positional parameters from any iterable of convertible values.
template<typename Range>
positional_params params_from_iter(const Range& range) {
    positional_params out;
    for (const auto& v : range) {
        out.push_back(to_value(v));
    }
    return out;
}

// ============================================================================
// Conversions from value_t
// ============================================================================

namespace detail {
    template<typename T>
    T from_value(const value_t& v);

    template<> inline int64_t from_value<int64_t>(const value_t& v) {
        return std::get<int64_t>(v);
    }
    template<> inline int from_value<int>(const value_t& v) {
        return static_cast<int>(std::get<int64_t>(v));
    }
    template<> inline bool from_value<bool>(const value_t& v) {
        return std::get<int64_t>(v) != 0;
    }
    template<> inline double from_value<double>(const value_t& v) {
        return std::get<double>(v);
    }
    template<> inline std::string from_value<std::string>(const value_t& v) {
        return std::get<std::string>(v);
    }
    template<> inline std::vector<uint8_t> from_value<std::vector<uint8_t>>(const value_t& v) {
        return std::get<std::vector<uint8_t>>(v);
    }
} // namespace detail

} // namespace stablesql

#endif // __cplusplus
