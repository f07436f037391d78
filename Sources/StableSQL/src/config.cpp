#include "stablesql/config.hpp"
#include "stablesql/error.hpp"
#include "stablesql/stable_io.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace stablesql {

using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 5> supported_journal_modes = {
    "memory", "off", "delete", "truncate", "persist"
};

const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "warn";
}

log_level parse_log_level(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    throw db_error("Unknown log level: " + name);
}

} // namespace

void configuration::validate() const {
    if (path.empty()) {
        throw db_error("Configuration path must not be empty");
    }
    if (!is_valid_page_size(page_size)) {
        throw db_error("Invalid page size " + std::to_string(page_size) +
                       ": must be a power of two in [512, 65536]");
    }
    bool known = std::any_of(supported_journal_modes.begin(), supported_journal_modes.end(),
                             [&](const char* m) { return journal_mode == m; });
    if (!known) {
        throw db_error("Unsupported journal mode: " + journal_mode);
    }
}

std::string configuration::to_json() const {
    json j;
    j["path"] = path;
    j["page_size"] = page_size;
    j["journal_mode"] = journal_mode;
    j["cache_size"] = cache_size;
    j["log_level"] = log_level_name(level);
    return j.dump();
}

configuration configuration::from_json(const std::string& text) {
    configuration config;
    try {
        json j = json::parse(text);
        if (j.contains("path")) config.path = j["path"].get<std::string>();
        if (j.contains("page_size")) config.page_size = j["page_size"].get<uint32_t>();
        if (j.contains("journal_mode")) {
            config.journal_mode = j["journal_mode"].get<std::string>();
            std::transform(config.journal_mode.begin(), config.journal_mode.end(),
                           config.journal_mode.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }
        if (j.contains("cache_size")) config.cache_size = j["cache_size"].get<int32_t>();
        if (j.contains("log_level")) config.level = parse_log_level(j["log_level"].get<std::string>());
    } catch (const json::exception& e) {
        LOG_ERROR("config", "Failed to parse configuration: %s", e.what());
        throw db_error("Failed to parse configuration: " + std::string(e.what()));
    }
    config.validate();
    return config;
}

} // namespace stablesql
