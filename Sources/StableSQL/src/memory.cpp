#include "stablesql/memory.hpp"
#include "stablesql/error.hpp"
#include "stablesql/log.hpp"
#include <algorithm>
#include <new>
#include <stdexcept>
#include <string>

namespace stablesql {

uint64_t heap_memory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_.size() / unit_size;
}

std::optional<uint64_t> heap_memory::grow(uint64_t units) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t current = bytes_.size() / unit_size;
    if (max_units_ && (units > *max_units_ || current > *max_units_ - units)) {
        LOG_WARN("heap_memory", "Refusing to grow %llu by %llu units (limit %llu)",
                 (unsigned long long)current, (unsigned long long)units,
                 (unsigned long long)*max_units_);
        return std::nullopt;
    }
    if (units > bytes_.max_size() / unit_size - current) {
        LOG_WARN("heap_memory", "Refusing to grow %llu by %llu units (address space)",
                 (unsigned long long)current, (unsigned long long)units);
        return std::nullopt;
    }
    try {
        bytes_.resize((current + units) * unit_size, 0);
    } catch (const std::bad_alloc&) {
        LOG_WARN("heap_memory", "Out of memory growing %llu by %llu units",
                 (unsigned long long)current, (unsigned long long)units);
        return std::nullopt;
    } catch (const std::length_error&) {
        LOG_WARN("heap_memory", "Refusing to grow %llu by %llu units (length)",
                 (unsigned long long)current, (unsigned long long)units);
        return std::nullopt;
    }
    return current + units;
}

void heap_memory::read(uint64_t offset, std::span<uint8_t> dst) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset + dst.size() > bytes_.size()) {
        throw db_error("heap_memory read out of bounds at offset " + std::to_string(offset));
    }
    std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(offset), dst.size(), dst.begin());
}

void heap_memory::write(uint64_t offset, std::span<const uint8_t> src) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset + src.size() > bytes_.size()) {
        throw db_error("heap_memory write out of bounds at offset " + std::to_string(offset));
    }
    std::copy(src.begin(), src.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(offset));
}

} // namespace stablesql
