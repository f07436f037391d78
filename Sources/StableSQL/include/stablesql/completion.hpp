#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <future>
#include <span>

namespace stablesql {

enum class completion_kind {
    read,
    write,
    sync
};

/// One in-flight I/O operation. Move-only and fulfilled exactly once; the
/// submitter keeps the future, the storage layer owns the completion.
///
///     auto c = completion::read(buf);
///     auto done = c.get_future();
///     storage.read_page(3, std::move(c));
///     int32_t n = io.wait(done);
class completion {
public:
    using id_type = uint64_t;

    static completion read(std::span<uint8_t> buffer);
    static completion write();
    static completion sync();

    completion(completion&&) noexcept = default;
    completion& operator=(completion&&) noexcept = default;

    // Non-copyable
    completion(const completion&) = delete;
    completion& operator=(const completion&) = delete;

    [[nodiscard]] id_type id() const noexcept { return id_; }
    [[nodiscard]] completion_kind kind() const noexcept { return kind_; }

    /// Target buffer of a read completion; empty for write and sync.
    [[nodiscard]] std::span<uint8_t> buffer() const noexcept { return buffer_; }

    /// Resolve with the number of bytes transferred. Throws db_error if the
    /// completion was already resolved.
    void complete(int32_t result);

    [[nodiscard]] bool is_completed() const noexcept { return completed_; }

    /// The result future. May be taken once.
    std::future<int32_t> get_future();

private:
    completion(completion_kind kind, std::span<uint8_t> buffer);

    id_type id_;
    completion_kind kind_;
    std::span<uint8_t> buffer_;
    std::promise<int32_t> promise_;
    bool completed_ = false;
};

} // namespace stablesql

#endif // __cplusplus
