#include "stablesql/stable_io.hpp"
#include "stablesql/error.hpp"
#include "stablesql/log.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <string>

namespace stablesql {

namespace {

// Copies what lies below `available` into the buffer and zero-fills the rest.
// Returns the number of bytes actually transferred.
template<typename ReadFn>
int32_t read_clamped(uint64_t offset, std::span<uint8_t> dst, uint64_t available, ReadFn&& read) {
    uint64_t n = 0;
    if (offset < available) {
        n = std::min<uint64_t>(dst.size(), available - offset);
        read(dst.first(static_cast<size_t>(n)));
    }
    if (n < dst.size()) {
        std::memset(dst.data() + n, 0, dst.size() - static_cast<size_t>(n));
    }
    return static_cast<int32_t>(n);
}

} // namespace

// ============================================================================
// stable_file
// ============================================================================

void stable_file::pread(uint64_t offset, completion c) {
    auto buf = c.buffer();
    int32_t nr = read_clamped(offset, buf, memory_->size_bytes(), [&](std::span<uint8_t> dst) {
        memory_->read(offset, dst);
    });
    LOG_DEBUG("stable_file", "pread op=%llu offset=%llu len=%zu -> %d",
              (unsigned long long)c.id(), (unsigned long long)offset, buf.size(), nr);
    c.complete(nr);
}

void stable_file::pwrite(uint64_t offset, std::span<const uint8_t> buffer, completion c) {
    uint64_t required_end = offset + buffer.size();
    uint64_t current_units = memory_->size();

    if (required_end > current_units * virtual_memory::unit_size) {
        uint64_t required_units = (required_end + virtual_memory::unit_size - 1) / virtual_memory::unit_size;
        uint64_t units_to_grow = required_units - current_units;
        if (!memory_->grow(units_to_grow)) {
            LOG_ERROR("stable_file", "Could not grow memory by %llu units for write at %llu",
                      (unsigned long long)units_to_grow, (unsigned long long)offset);
            throw growth_error("Could not grow memory.");
        }
        LOG_DEBUG("stable_file", "Grew memory %llu -> %llu units",
                  (unsigned long long)current_units, (unsigned long long)required_units);
    }

    memory_->write(offset, buffer);
    c.complete(static_cast<int32_t>(buffer.size()));
}

void stable_file::sync(completion c) {
    c.complete(0);
}

uint64_t stable_file::size() const {
    return memory_->size_bytes();
}

void stable_file::truncate(uint64_t size) {
    LOG_DEBUG("stable_file", "Ignoring truncate to %llu bytes (memory never shrinks)",
              (unsigned long long)size);
}

// ============================================================================
// memory_file
// ============================================================================

void memory_file::pread(uint64_t offset, completion c) {
    int32_t nr = read_clamped(offset, c.buffer(), data_.size(), [&](std::span<uint8_t> dst) {
        std::memcpy(dst.data(), data_.data() + offset, dst.size());
    });
    c.complete(nr);
}

void memory_file::pwrite(uint64_t offset, std::span<const uint8_t> buffer, completion c) {
    uint64_t required_end = offset + buffer.size();
    if (required_end > data_.size()) {
        data_.resize(static_cast<size_t>(required_end), 0);
    }
    std::copy(buffer.begin(), buffer.end(), data_.begin() + static_cast<std::ptrdiff_t>(offset));
    c.complete(static_cast<int32_t>(buffer.size()));
}

void memory_file::sync(completion c) {
    c.complete(0);
}

void memory_file::truncate(uint64_t size) {
    data_.resize(static_cast<size_t>(size));
}

// ============================================================================
// database_storage
// ============================================================================

void database_storage::read_page(size_t index, completion c) {
    size_t size = c.buffer().size();
    if (index == 0) {
        throw storage_error("Page index 0 is invalid; pages are 1-based");
    }
    if (!is_valid_page_size(size)) {
        throw storage_error("Invalid page size " + std::to_string(size) +
                            ": must be a power of two in [512, 65536]");
    }
    uint64_t pos = static_cast<uint64_t>(index - 1) * size;
    file_->pread(pos, std::move(c));
}

void database_storage::write_page(size_t index, std::span<const uint8_t> buffer, completion c) {
    uint64_t pos = static_cast<uint64_t>(index - 1) * buffer.size();
    file_->pwrite(pos, buffer, std::move(c));
}

void database_storage::sync(completion c) {
    file_->sync(std::move(c));
}

// ============================================================================
// stable_io
// ============================================================================

stable_io::stable_io(std::shared_ptr<virtual_memory> memory, context ctx)
    : memory_(std::move(memory))
    , context_(std::move(ctx))
    , clock_(context_.time_ns)
{
    LOG_DEBUG("stable_io", "Initializing with %llu units of virtual memory",
              (unsigned long long)memory_->size());
}

std::shared_ptr<file> stable_io::open_file(std::string_view path) {
    LOG_DEBUG("stable_io", "open_file %.*s", (int)path.size(), path.data());
    return std::make_shared<stable_file>(memory_);
}

std::shared_ptr<file> stable_io::open_memory_file() {
    return std::make_shared<memory_file>();
}

void stable_io::run_once() {
    // nop
}

int32_t stable_io::wait(std::future<int32_t>& result) {
    while (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        run_once();
    }
    return result.get();
}

int64_t stable_io::generate_random_number() {
    uint8_t buf[8];
    fill_random(buf);
    int64_t out;
    std::memcpy(&out, buf, sizeof(out));
    return out;
}

void stable_io::fill_random(std::span<uint8_t> dst) {
    context_.random(dst);
}

} // namespace stablesql
