#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace stablesql {

/// Host-provided, byte-addressable region that grows in fixed-size units
/// and never shrinks.
class virtual_memory {
public:
    /// Growth unit in bytes (64 KiB, the host's page size).
    static constexpr uint64_t unit_size = 65536;

    virtual ~virtual_memory() = default;

    /// Current size in units.
    [[nodiscard]] virtual uint64_t size() const = 0;

    /// Grow by `units`. Returns the new size in units, or nullopt if the
    /// host declined; a declined grow leaves the size unchanged.
    virtual std::optional<uint64_t> grow(uint64_t units) = 0;

    /// Copy bytes at `offset` into `dst`. The range must lie within size().
    virtual void read(uint64_t offset, std::span<uint8_t> dst) const = 0;

    /// Copy `src` to `offset`. The range must lie within size().
    virtual void write(uint64_t offset, std::span<const uint8_t> src) = 0;

    [[nodiscard]] uint64_t size_bytes() const { return size() * unit_size; }
};

/// virtual_memory on the process heap. An optional unit limit makes grow()
/// fail once the limit would be exceeded.
class heap_memory : public virtual_memory {
public:
    heap_memory() = default;
    explicit heap_memory(uint64_t max_units) : max_units_(max_units) {}

    // Non-copyable
    heap_memory(const heap_memory&) = delete;
    heap_memory& operator=(const heap_memory&) = delete;

    [[nodiscard]] uint64_t size() const override;
    std::optional<uint64_t> grow(uint64_t units) override;
    void read(uint64_t offset, std::span<uint8_t> dst) const override;
    void write(uint64_t offset, std::span<const uint8_t> src) override;

    [[nodiscard]] std::optional<uint64_t> max_units() const { return max_units_; }

private:
    mutable std::mutex mutex_;
    std::vector<uint8_t> bytes_;
    std::optional<uint64_t> max_units_;
};

} // namespace stablesql

#endif // __cplusplus
