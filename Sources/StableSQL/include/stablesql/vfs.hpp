#pragma once

#ifdef __cplusplus

#include "stable_io.hpp"
#include <sqlite3.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace stablesql {

/// A SQLite VFS registered under a unique name for one database. The main
/// database file is served by database_storage over the stable_io memory;
/// journals and temp files live in memory_file instances.
///
/// Connections of one database share the main file, so the VFS keeps the
/// engine's SHARED/RESERVED/PENDING/EXCLUSIVE locks in process: a second
/// writer, or a writer that would change pages under an open reader, gets
/// SQLITE_BUSY.
///
/// Must outlive every sqlite3 connection opened through it.
class vfs {
public:
    explicit vfs(std::shared_ptr<stable_io> io);
    ~vfs();

    // Non-copyable, non-movable: SQLite holds the address of base_
    vfs(const vfs&) = delete;
    vfs& operator=(const vfs&) = delete;

    /// Name to pass as the zVfs argument of sqlite3_open_v2.
    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] stable_io& io() { return *io_; }

    /// Storage for the main database file, created on first use.
    std::shared_ptr<database_storage> main_storage(const std::string& path);

    /// Named auxiliary file. Returns nullptr if absent and !create.
    std::shared_ptr<file> aux_file(const std::string& path, bool create);
    bool has_aux_file(const std::string& path);
    void remove_aux_file(const std::string& path);

    /// Raises `holder`'s lock on the main database from `current` towards
    /// `level` (SQLITE_LOCK_*), updating `current`. Returns SQLITE_BUSY if
    /// another holder's lock conflicts.
    int lock(const void* holder, int& current, int level);
    /// Lowers `holder`'s lock to `level` (SQLITE_LOCK_SHARED or _NONE).
    void unlock(const void* holder, int& current, int level);
    /// True if any holder has RESERVED or above.
    bool reserved_held();

private:
    std::string name_;
    sqlite3_vfs base_{};
    std::shared_ptr<stable_io> io_;
    std::shared_ptr<database_storage> main_;
    std::string main_path_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<file>> aux_files_;

    struct lock_table {
        int shared = 0;
        const void* reserved = nullptr;
        const void* pending = nullptr;
        const void* exclusive = nullptr;
    };
    lock_table locks_;
};

} // namespace stablesql

#endif // __cplusplus
