#include "stablesql/vfs.hpp"
#include "stablesql/error.hpp"
#include "stablesql/log.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

namespace stablesql {

namespace {

std::atomic<uint64_t> g_vfs_counter{0};

// Julian day number of the Unix epoch, in milliseconds.
constexpr sqlite3_int64 unix_epoch_julian_ms = 210866760000000LL;

struct open_file {
    vfs* owner = nullptr;
    std::shared_ptr<file> target;
    std::shared_ptr<database_storage> storage;  // main database only
    std::string name;
    bool delete_on_close = false;
    int lock = SQLITE_LOCK_NONE;  // main database only
};

struct vfs_file {
    sqlite3_file base;  // must be first
    open_file* impl;
};

open_file& impl_of(sqlite3_file* f) {
    return *reinterpret_cast<vfs_file*>(f)->impl;
}

vfs& owner_of(sqlite3_vfs* v) {
    return *static_cast<vfs*>(v->pAppData);
}

// ----------------------------------------------------------------------------
// sqlite3_io_methods
// ----------------------------------------------------------------------------

int x_close(sqlite3_file* f) {
    auto* vf = reinterpret_cast<vfs_file*>(f);
    open_file* impl = vf->impl;
    try {
        if (impl->storage && impl->lock != SQLITE_LOCK_NONE) {
            impl->owner->unlock(impl, impl->lock, SQLITE_LOCK_NONE);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Releasing lock on close failed: %s", e.what());
    }
    if (impl->delete_on_close && !impl->name.empty()) {
        impl->owner->remove_aux_file(impl->name);
    }
    delete impl;
    vf->impl = nullptr;
    return SQLITE_OK;
}

int x_read(sqlite3_file* f, void* buf, int amt, sqlite3_int64 offset) {
    auto& of = impl_of(f);
    try {
        std::span<uint8_t> dst(static_cast<uint8_t*>(buf), static_cast<size_t>(amt));
        auto c = completion::read(dst);
        auto done = c.get_future();
        auto size = static_cast<size_t>(amt);
        if (of.storage && is_valid_page_size(size) && offset % amt == 0) {
            of.storage->read_page(static_cast<size_t>(offset / amt) + 1, std::move(c));
        } else {
            of.target->pread(static_cast<uint64_t>(offset), std::move(c));
        }
        int32_t nr = of.owner->io().wait(done);
        return nr < amt ? SQLITE_IOERR_SHORT_READ : SQLITE_OK;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Read of %d bytes at %lld failed: %s", amt, (long long)offset, e.what());
        return SQLITE_IOERR_READ;
    }
}

int x_write(sqlite3_file* f, const void* buf, int amt, sqlite3_int64 offset) {
    auto& of = impl_of(f);
    try {
        std::span<const uint8_t> src(static_cast<const uint8_t*>(buf), static_cast<size_t>(amt));
        auto c = completion::write();
        auto done = c.get_future();
        if (of.storage && is_valid_page_size(src.size()) && offset % amt == 0) {
            of.storage->write_page(static_cast<size_t>(offset / amt) + 1, src, std::move(c));
        } else {
            of.target->pwrite(static_cast<uint64_t>(offset), src, std::move(c));
        }
        of.owner->io().wait(done);
        return SQLITE_OK;
    } catch (const growth_error& e) {
        LOG_ERROR("vfs", "Write of %d bytes at %lld failed: %s", amt, (long long)offset, e.what());
        return SQLITE_FULL;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Write of %d bytes at %lld failed: %s", amt, (long long)offset, e.what());
        return SQLITE_IOERR_WRITE;
    }
}

int x_truncate(sqlite3_file* f, sqlite3_int64 size) {
    try {
        impl_of(f).target->truncate(static_cast<uint64_t>(size));
        return SQLITE_OK;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Truncate failed: %s", e.what());
        return SQLITE_IOERR_TRUNCATE;
    }
}

int x_sync(sqlite3_file* f, int) {
    auto& of = impl_of(f);
    try {
        auto c = completion::sync();
        auto done = c.get_future();
        if (of.storage) {
            of.storage->sync(std::move(c));
        } else {
            of.target->sync(std::move(c));
        }
        of.owner->io().wait(done);
        return SQLITE_OK;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Sync failed: %s", e.what());
        return SQLITE_IOERR_FSYNC;
    }
}

int x_file_size(sqlite3_file* f, sqlite3_int64* size) {
    auto& of = impl_of(f);
    *size = static_cast<sqlite3_int64>(of.storage ? of.storage->size() : of.target->size());
    return SQLITE_OK;
}

// Journals and temp files belong to one connection; only the main database
// is locked.
int x_lock(sqlite3_file* f, int level) {
    auto& of = impl_of(f);
    if (!of.storage) {
        return SQLITE_OK;
    }
    try {
        int rc = of.owner->lock(&of, of.lock, level);
        if (rc == SQLITE_OK && of.lock == SQLITE_LOCK_EXCLUSIVE) {
            of.target->lock_file(true);
        }
        return rc;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Lock failed: %s", e.what());
        return SQLITE_IOERR_LOCK;
    }
}

int x_unlock(sqlite3_file* f, int level) {
    auto& of = impl_of(f);
    if (!of.storage) {
        return SQLITE_OK;
    }
    try {
        of.owner->unlock(&of, of.lock, level);
        if (level == SQLITE_LOCK_NONE) {
            of.target->unlock_file();
        }
        return SQLITE_OK;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Unlock failed: %s", e.what());
        return SQLITE_IOERR_UNLOCK;
    }
}

int x_check_reserved_lock(sqlite3_file* f, int* out) {
    auto& of = impl_of(f);
    try {
        *out = of.storage && of.owner->reserved_held() ? 1 : 0;
        return SQLITE_OK;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Reserved lock check failed: %s", e.what());
        return SQLITE_IOERR_CHECKRESERVEDLOCK;
    }
}

int x_file_control(sqlite3_file*, int, void*) {
    return SQLITE_NOTFOUND;
}

int x_sector_size(sqlite3_file*) {
    return 512;
}

int x_device_characteristics(sqlite3_file*) {
    return 0;
}

const sqlite3_io_methods* io_methods() {
    static const sqlite3_io_methods methods = [] {
        sqlite3_io_methods m{};
        m.iVersion = 1;
        m.xClose = x_close;
        m.xRead = x_read;
        m.xWrite = x_write;
        m.xTruncate = x_truncate;
        m.xSync = x_sync;
        m.xFileSize = x_file_size;
        m.xLock = x_lock;
        m.xUnlock = x_unlock;
        m.xCheckReservedLock = x_check_reserved_lock;
        m.xFileControl = x_file_control;
        m.xSectorSize = x_sector_size;
        m.xDeviceCharacteristics = x_device_characteristics;
        return m;
    }();
    return &methods;
}

// ----------------------------------------------------------------------------
// sqlite3_vfs
// ----------------------------------------------------------------------------

int x_open(sqlite3_vfs* v, const char* name, sqlite3_file* f, int flags, int* out_flags) {
    auto* vf = reinterpret_cast<vfs_file*>(f);
    vf->base.pMethods = nullptr;
    vf->impl = nullptr;
    auto& owner = owner_of(v);
    try {
        auto impl = std::make_unique<open_file>();
        impl->owner = &owner;
        if (flags & SQLITE_OPEN_MAIN_DB) {
            impl->storage = owner.main_storage(name ? name : "");
            impl->target = impl->storage ? std::shared_ptr<file>(impl->storage, &impl->storage->underlying())
                                         : nullptr;
        } else if (name) {
            impl->name = name;
            impl->target = owner.aux_file(name, (flags & SQLITE_OPEN_CREATE) != 0);
            impl->delete_on_close = (flags & SQLITE_OPEN_DELETEONCLOSE) != 0;
        } else {
            impl->target = owner.io().open_memory_file();
        }
        if (!impl->target) {
            return SQLITE_CANTOPEN;
        }
        LOG_DEBUG("vfs", "Opened %s (flags=0x%x)", name ? name : "<temp>", flags);
        vf->impl = impl.release();
        vf->base.pMethods = io_methods();
        if (out_flags) *out_flags = flags;
        return SQLITE_OK;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Open of %s failed: %s", name ? name : "<temp>", e.what());
        return SQLITE_CANTOPEN;
    }
}

int x_delete(sqlite3_vfs* v, const char* name, int) {
    try {
        owner_of(v).remove_aux_file(name);
        return SQLITE_OK;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Delete of %s failed: %s", name, e.what());
        return SQLITE_IOERR_DELETE;
    }
}

int x_access(sqlite3_vfs* v, const char* name, int, int* out) {
    try {
        *out = owner_of(v).has_aux_file(name) ? 1 : 0;
        return SQLITE_OK;
    } catch (const std::exception& e) {
        LOG_ERROR("vfs", "Access check of %s failed: %s", name, e.what());
        return SQLITE_IOERR_ACCESS;
    }
}

int x_full_pathname(sqlite3_vfs*, const char* name, int n_out, char* out) {
    std::strncpy(out, name, static_cast<size_t>(n_out));
    out[n_out - 1] = '\0';
    return SQLITE_OK;
}

void* x_dl_open(sqlite3_vfs*, const char*) {
    return nullptr;
}

void x_dl_error(sqlite3_vfs*, int n, char* msg) {
    std::snprintf(msg, static_cast<size_t>(n), "Loadable extensions are not supported");
}

using sqlite_symbol = void (*)(void);

sqlite_symbol x_dl_sym(sqlite3_vfs*, void*, const char*) {
    return nullptr;
}

void x_dl_close(sqlite3_vfs*, void*) {}

int x_randomness(sqlite3_vfs* v, int n, char* out) {
    owner_of(v).io().fill_random(std::span<uint8_t>(reinterpret_cast<uint8_t*>(out), static_cast<size_t>(n)));
    return n;
}

int x_sleep(sqlite3_vfs*, int micros) {
    std::this_thread::sleep_for(std::chrono::microseconds(micros));
    return micros;
}

int x_current_time_int64(sqlite3_vfs* v, sqlite3_int64* out) {
    instant now = owner_of(v).io().now();
    *out = unix_epoch_julian_ms + now.secs * 1000 + now.micros / 1000;
    return SQLITE_OK;
}

int x_current_time(sqlite3_vfs* v, double* out) {
    sqlite3_int64 ms = 0;
    x_current_time_int64(v, &ms);
    *out = static_cast<double>(ms) / 86400000.0;
    return SQLITE_OK;
}

int x_get_last_error(sqlite3_vfs*, int, char*) {
    return 0;
}

} // namespace

vfs::vfs(std::shared_ptr<stable_io> io)
    : name_("stablesql-" + std::to_string(g_vfs_counter.fetch_add(1, std::memory_order_relaxed)))
    , io_(std::move(io))
{
    base_.iVersion = 2;
    base_.szOsFile = sizeof(vfs_file);
    base_.mxPathname = 512;
    base_.zName = name_.c_str();
    base_.pAppData = this;
    base_.xOpen = x_open;
    base_.xDelete = x_delete;
    base_.xAccess = x_access;
    base_.xFullPathname = x_full_pathname;
    base_.xDlOpen = x_dl_open;
    base_.xDlError = x_dl_error;
    base_.xDlSym = x_dl_sym;
    base_.xDlClose = x_dl_close;
    base_.xRandomness = x_randomness;
    base_.xSleep = x_sleep;
    base_.xCurrentTime = x_current_time;
    base_.xGetLastError = x_get_last_error;
    base_.xCurrentTimeInt64 = x_current_time_int64;

    int rc = sqlite3_vfs_register(&base_, 0);
    if (rc != SQLITE_OK) {
        LOG_ERROR("vfs", "Failed to register VFS %s: %s", name_.c_str(), sqlite3_errstr(rc));
        throw db_error("Failed to register VFS: " + std::string(sqlite3_errstr(rc)));
    }
    LOG_DEBUG("vfs", "Registered %s", name_.c_str());
}

vfs::~vfs() {
    sqlite3_vfs_unregister(&base_);
}

std::shared_ptr<database_storage> vfs::main_storage(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!main_) {
        main_ = std::make_shared<database_storage>(io_->open_file(path));
        main_path_ = path;
    } else if (path != main_path_) {
        LOG_WARN("vfs", "Main database %s shares the memory of %s", path.c_str(), main_path_.c_str());
    }
    return main_;
}

std::shared_ptr<file> vfs::aux_file(const std::string& path, bool create) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aux_files_.find(path);
    if (it != aux_files_.end()) {
        return it->second;
    }
    if (!create) {
        return nullptr;
    }
    auto f = io_->open_memory_file();
    aux_files_.emplace(path, f);
    return f;
}

int vfs::lock(const void* holder, int& current, int level) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (current >= level) {
        return SQLITE_OK;
    }
    switch (level) {
        case SQLITE_LOCK_SHARED:
            // A pending writer keeps new readers out
            if ((locks_.pending && locks_.pending != holder) ||
                (locks_.exclusive && locks_.exclusive != holder)) {
                return SQLITE_BUSY;
            }
            ++locks_.shared;
            current = SQLITE_LOCK_SHARED;
            return SQLITE_OK;

        case SQLITE_LOCK_RESERVED:
            if (locks_.reserved && locks_.reserved != holder) {
                return SQLITE_BUSY;
            }
            locks_.reserved = holder;
            current = SQLITE_LOCK_RESERVED;
            return SQLITE_OK;

        case SQLITE_LOCK_EXCLUSIVE:
            // The engine never asks for PENDING; it is the way station here
            if (locks_.pending && locks_.pending != holder) {
                return SQLITE_BUSY;
            }
            locks_.pending = holder;
            current = SQLITE_LOCK_PENDING;
            // Every other reader must be gone first
            if (locks_.shared > 1) {
                return SQLITE_BUSY;
            }
            locks_.exclusive = holder;
            current = SQLITE_LOCK_EXCLUSIVE;
            return SQLITE_OK;
    }
    return SQLITE_MISUSE;
}

void vfs::unlock(const void* holder, int& current, int level) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (current <= level) {
        return;
    }
    if (current > SQLITE_LOCK_SHARED) {
        if (locks_.reserved == holder) locks_.reserved = nullptr;
        if (locks_.pending == holder) locks_.pending = nullptr;
        if (locks_.exclusive == holder) locks_.exclusive = nullptr;
    }
    if (level == SQLITE_LOCK_NONE) {
        --locks_.shared;
    }
    current = level;
}

bool vfs::reserved_held() {
    std::lock_guard<std::mutex> guard(mutex_);
    return locks_.reserved || locks_.pending || locks_.exclusive;
}

bool vfs::has_aux_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return aux_files_.count(path) > 0;
}

void vfs::remove_aux_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    aux_files_.erase(path);
}

} // namespace stablesql
