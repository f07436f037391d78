#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <cstdint>
#include <string>

namespace stablesql {

struct configuration {
    /// Name of the main database file inside the VFS. Any name maps onto the
    /// same backing memory.
    std::string path = "db";

    /// Page size applied when the database is created. Must be a power of two
    /// in [512, 65536]; ignored for an existing database.
    uint32_t page_size = 4096;

    /// Rollback journal mode: memory, off, delete, truncate or persist.
    /// WAL is not supported.
    std::string journal_mode = "memory";

    /// PRAGMA cache_size for every connection (negative = KiB).
    int32_t cache_size = -2000;

    /// Applied to the global log level on build().
    log_level level = log_level::warn;

    /// Throws db_error if any field is out of range.
    void validate() const;

    std::string to_json() const;

    /// Missing keys keep their defaults. Throws db_error on malformed JSON or
    /// invalid values.
    static configuration from_json(const std::string& json);
};

} // namespace stablesql

#endif // __cplusplus
