#include "stablesql/log.hpp"

namespace stablesql {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::warn};

} // namespace stablesql
