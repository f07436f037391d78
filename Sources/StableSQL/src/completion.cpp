#include "stablesql/completion.hpp"
#include "stablesql/error.hpp"
#include <atomic>
#include <string>

namespace stablesql {

namespace {
std::atomic<completion::id_type> g_next_completion_id{1};
}

completion::completion(completion_kind kind, std::span<uint8_t> buffer)
    : id_(g_next_completion_id.fetch_add(1, std::memory_order_relaxed))
    , kind_(kind)
    , buffer_(buffer)
{}

completion completion::read(std::span<uint8_t> buffer) {
    return completion(completion_kind::read, buffer);
}

completion completion::write() {
    return completion(completion_kind::write, {});
}

completion completion::sync() {
    return completion(completion_kind::sync, {});
}

void completion::complete(int32_t result) {
    if (completed_) {
        throw db_error("Completion " + std::to_string(id_) + " already completed");
    }
    completed_ = true;
    promise_.set_value(result);
}

std::future<int32_t> completion::get_future() {
    return promise_.get_future();
}

} // namespace stablesql
