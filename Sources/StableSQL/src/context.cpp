#include "stablesql/context.hpp"
#include <chrono>
#include <random>

namespace stablesql {

context context::system() {
    context ctx;
    ctx.random = [](std::span<uint8_t> dst) {
        static thread_local std::random_device rd;
        size_t i = 0;
        while (i < dst.size()) {
            auto word = rd();
            for (size_t b = 0; b < sizeof(word) && i < dst.size(); ++b, ++i) {
                dst[i] = static_cast<uint8_t>((word >> (b * 8)) & 0xFF);
            }
        }
    };
    ctx.time_ns = [] {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
    };
    return ctx;
}

instant clock_adapter::now() const {
    return from_nanos(time_ns_());
}

} // namespace stablesql
