#pragma once

#ifdef __cplusplus

#include "completion.hpp"
#include "context.hpp"
#include "memory.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace stablesql {

/// Smallest and largest page size the engine accepts.
constexpr size_t min_page_size = 512;
constexpr size_t max_page_size = 65536;

/// True for powers of two in [min_page_size, max_page_size].
constexpr bool is_valid_page_size(size_t size) {
    return size >= min_page_size && size <= max_page_size && (size & (size - 1)) == 0;
}

// ============================================================================
// file - positional I/O with completion-based results
// ============================================================================

class file {
public:
    virtual ~file() = default;

    virtual void lock_file(bool exclusive) = 0;
    virtual void unlock_file() = 0;

    /// Fill c.buffer() from `offset`. Bytes past the end read as zero and
    /// are not counted in the completion result.
    virtual void pread(uint64_t offset, completion c) = 0;
    virtual void pwrite(uint64_t offset, std::span<const uint8_t> buffer, completion c) = 0;
    virtual void sync(completion c) = 0;

    /// Addressable length in bytes.
    [[nodiscard]] virtual uint64_t size() const = 0;

    virtual void truncate(uint64_t size) = 0;
};

/// file over a virtual_memory. Every operation completes before returning:
/// the medium is host-resident memory.
///
/// sync() is a no-op: the medium has no separate flush step, so durability
/// is whatever the host gives its memory. This is not block-device
/// semantics; a port onto a real disk must flush here.
class stable_file : public file {
public:
    explicit stable_file(std::shared_ptr<virtual_memory> memory) : memory_(std::move(memory)) {}

    // Storage is private to one process instance; nothing to lock.
    void lock_file(bool) override {}
    void unlock_file() override {}

    void pread(uint64_t offset, completion c) override;

    /// Grows the memory by the minimal number of units covering
    /// offset + buffer.size(). Throws growth_error, before writing anything,
    /// if the host declines.
    void pwrite(uint64_t offset, std::span<const uint8_t> buffer, completion c) override;

    void sync(completion c) override;

    /// Capacity in bytes; always a multiple of virtual_memory::unit_size.
    [[nodiscard]] uint64_t size() const override;

    /// The backing memory never shrinks, so this only logs.
    void truncate(uint64_t size) override;

private:
    std::shared_ptr<virtual_memory> memory_;
};

/// Heap-resident file with a logical length, for the engine's auxiliary
/// files (rollback journal, temp files). Callers serialize access.
class memory_file : public file {
public:
    void lock_file(bool) override {}
    void unlock_file() override {}
    void pread(uint64_t offset, completion c) override;
    void pwrite(uint64_t offset, std::span<const uint8_t> buffer, completion c) override;
    void sync(completion c) override;
    [[nodiscard]] uint64_t size() const override { return data_.size(); }
    void truncate(uint64_t size) override;

private:
    std::vector<uint8_t> data_;
};

// ============================================================================
// database_storage - 1-based pages over a file
// ============================================================================

class database_storage {
public:
    explicit database_storage(std::shared_ptr<file> file) : file_(std::move(file)) {}

    /// Reads page `index` (1-based) into c.buffer(), whose length is the page
    /// size. Throws storage_error without reading if the length is not a
    /// valid page size or the index is 0.
    void read_page(size_t index, completion c);

    /// Writes `buffer` as page `index`. The page size was validated when the
    /// database was opened and is not re-checked here.
    void write_page(size_t index, std::span<const uint8_t> buffer, completion c);

    void sync(completion c);

    /// Total addressable bytes; the engine derives the page count from it.
    [[nodiscard]] uint64_t size() const { return file_->size(); }

    [[nodiscard]] file& underlying() { return *file_; }

private:
    std::shared_ptr<file> file_;
};

// ============================================================================
// stable_io - the engine's I/O object
// ============================================================================

class stable_io {
public:
    stable_io(std::shared_ptr<virtual_memory> memory, context ctx);

    // Non-copyable
    stable_io(const stable_io&) = delete;
    stable_io& operator=(const stable_io&) = delete;

    /// The main database file. Every path maps onto the same memory.
    std::shared_ptr<file> open_file(std::string_view path);

    /// A fresh auxiliary file, not backed by the virtual memory.
    std::shared_ptr<file> open_memory_file();

    /// Drives pending I/O. Nothing is ever pending for this backend: every
    /// completion resolves inside the call that submitted it.
    void run_once();

    /// Drives run_once() until `result` is ready, then returns it.
    int32_t wait(std::future<int32_t>& result);

    int64_t generate_random_number();
    void fill_random(std::span<uint8_t> dst);

    [[nodiscard]] instant now() const { return clock_.now(); }

    [[nodiscard]] const std::shared_ptr<virtual_memory>& memory() const { return memory_; }

private:
    std::shared_ptr<virtual_memory> memory_;
    context context_;
    clock_adapter clock_;
};

} // namespace stablesql

#endif // __cplusplus
