#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <functional>
#include <span>
#include <utility>

namespace stablesql {

/// Wall-clock time in the engine's (seconds, microseconds) shape.
struct instant {
    int64_t secs = 0;
    uint32_t micros = 0;

    bool operator==(const instant& other) const = default;
};

/// Host services threaded explicitly through builder::build() instead of
/// living in globals.
struct context {
    /// Fills the span with cryptographically random bytes.
    std::function<void(std::span<uint8_t>)> random;

    /// Host wall-clock time in nanoseconds since the Unix epoch.
    std::function<uint64_t()> time_ns;

    /// std::random_device and std::chrono::system_clock.
    static context system();
};

/// Exposes host wall-clock time as an instant. No ordering guarantee beyond
/// the host source's own.
class clock_adapter {
public:
    explicit clock_adapter(std::function<uint64_t()> time_ns) : time_ns_(std::move(time_ns)) {}

    [[nodiscard]] instant now() const;

    static instant from_nanos(uint64_t ns) {
        return instant{static_cast<int64_t>(ns / 1'000'000'000),
                       static_cast<uint32_t>((ns % 1'000'000'000) / 1'000)};
    }

private:
    std::function<uint64_t()> time_ns_;
};

} // namespace stablesql

#endif // __cplusplus
