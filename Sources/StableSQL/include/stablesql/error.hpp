#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace stablesql {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// A parameter could not be bound: unknown name, index out of range, or a
/// value the engine refuses (e.g. too large).
class binding_error : public db_error {
public:
    explicit binding_error(const std::string& msg) : db_error(msg) {}
};

/// The engine lock could not be acquired. Only the current call fails.
class synchronization_error : public db_error {
public:
    explicit synchronization_error(const std::string& msg) : db_error(msg) {}
};

/// Compile, runtime or storage fault reported by the engine.
class execution_error : public db_error {
public:
    execution_error(const std::string& msg, int code) : db_error(msg), code_(code) {}

    /// SQLite primary or extended result code.
    int code() const noexcept { return code_; }

private:
    int code_;
};

class busy_error : public execution_error {
public:
    explicit busy_error(const std::string& msg, int code) : execution_error(msg, code) {}
};

class interrupted_error : public execution_error {
public:
    explicit interrupted_error(const std::string& msg, int code) : execution_error(msg, code) {}
};

/// Page geometry violation (size not a power of two in [512, 65536], or
/// page index 0). Fatal to the page operation, never retried.
class storage_error : public db_error {
public:
    explicit storage_error(const std::string& msg) : db_error(msg) {}
};

/// The host declined to grow the backing memory. Nothing was written.
class growth_error : public storage_error {
public:
    explicit growth_error(const std::string& msg) : storage_error(msg) {}
};

} // namespace stablesql

#endif // __cplusplus
