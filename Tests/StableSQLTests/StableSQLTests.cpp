#include <StableSQL.hpp>
#include <stablesql/vfs.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "StorageTests.hpp"
#include "StatementTests.hpp"
#include "TransactionTests.hpp"

// ============================================================================
// Configuration
// ============================================================================

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    stablesql::configuration defaults;
    defaults.validate();
    assert(defaults.page_size == 4096);
    assert(defaults.journal_mode == "memory");

    auto parsed = stablesql::configuration::from_json(
        R"({"path": "main.db", "page_size": 8192, "journal_mode": "TRUNCATE", "log_level": "error"})");
    assert(parsed.path == "main.db");
    assert(parsed.page_size == 8192);
    assert(parsed.journal_mode == "truncate");
    assert(parsed.cache_size == defaults.cache_size);
    assert(parsed.level == stablesql::log_level::error);

    auto again = stablesql::configuration::from_json(parsed.to_json());
    assert(again.path == parsed.path);
    assert(again.page_size == parsed.page_size);
    assert(again.level == parsed.level);

    for (const char* bad : {R"({"page_size": 1000})",
                            R"({"page_size": 131072})",
                            R"({"journal_mode": "wal"})",
                            R"({"path": ""})",
                            R"({"log_level": "loud"})",
                            R"({"page_size": "big"})",
                            "{not json"}) {
        bool threw = false;
        try {
            stablesql::configuration::from_json(bad);
        } catch (const stablesql::db_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "  Configuration test passed!" << std::endl;
}

// ============================================================================
// Builder
// ============================================================================

void test_builder() {
    std::cout << "Testing builder..." << std::endl;

    bool threw = false;
    try {
        stablesql::builder::with_memory(nullptr);
    } catch (const stablesql::db_error&) {
        threw = true;
    }
    assert(threw);

    stablesql::configuration bad;
    bad.page_size = 3000;
    threw = false;
    try {
        stablesql::builder::with_memory(std::make_shared<stablesql::heap_memory>()).with_config(bad).build();
    } catch (const stablesql::db_error&) {
        threw = true;
    }
    assert(threw);

    // A fresh database materializes page 1 in the first unit
    auto memory = std::make_shared<storage_tests::counting_memory>();
    stablesql::configuration config;
    config.page_size = 65536;
    config.level = stablesql::log_level::error;
    auto db = stablesql::builder::with_memory(memory).with_config(config).build();
    assert(memory->size() == 1);
    assert(db.config().page_size == 65536);
    assert(stablesql::get_log_level() == stablesql::log_level::error);

    auto conn = db.connect();
    conn.execute("CREATE TABLE t (x)");
    conn.execute("INSERT INTO t VALUES (zeroblob(100000))");
    assert(memory->size_bytes() % stablesql::virtual_memory::unit_size == 0);
    for (auto units : memory->grows) {
        assert(units >= 1);
    }

    stablesql::set_log_level(stablesql::log_level::warn);
    std::cout << "  Builder test passed!" << std::endl;
}

// ============================================================================
// Host services reach the engine through the VFS
// ============================================================================

void test_vfs_host_services() {
    std::cout << "Testing VFS host services..." << std::endl;

    stablesql::context ctx;
    ctx.time_ns = [] { return uint64_t{1'700'000'000'250'000'000}; };
    ctx.random = [](std::span<uint8_t> dst) {
        for (auto& b : dst) b = 0x5A;
    };

    auto db = stablesql::builder::with_memory(std::make_shared<stablesql::heap_memory>())
                  .with_context(ctx).build();
    auto conn = db.connect();
    auto rs = conn.query("SELECT CAST(strftime('%s', 'now') AS INTEGER)");
    assert(rs.next()->get<int64_t>(0) == 1'700'000'000);

    std::string name;
    {
        auto io = std::make_shared<stablesql::stable_io>(std::make_shared<stablesql::heap_memory>(), ctx);
        stablesql::vfs fs(io);
        name = fs.name();
        sqlite3_vfs* registered = sqlite3_vfs_find(name.c_str());
        assert(registered != nullptr);

        sqlite3_int64 now = 0;
        assert(registered->xCurrentTimeInt64(registered, &now) == SQLITE_OK);
        assert(now == 210866760000000LL + 1'700'000'000LL * 1000 + 250);

        char buf[8] = {};
        registered->xRandomness(registered, sizeof(buf), buf);
        for (char c : buf) {
            assert(c == 0x5A);
        }

        // Auxiliary files are created on demand and removable
        assert(fs.aux_file("db-journal", false) == nullptr);
        auto journal = fs.aux_file("db-journal", true);
        assert(journal != nullptr);
        assert(fs.has_aux_file("db-journal"));
        assert(fs.aux_file("db-journal", false) == journal);
        fs.remove_aux_file("db-journal");
        assert(!fs.has_aux_file("db-journal"));

        // One storage per database, whatever the path
        auto a = fs.main_storage("db");
        auto b = fs.main_storage("other");
        assert(a == b);
    }
    assert(sqlite3_vfs_find(name.c_str()) == nullptr);

    std::cout << "  VFS host services test passed!" << std::endl;
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== StableSQL Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        storage_tests::run_all();
        test_configuration();
        test_builder();
        test_vfs_host_services();
        statement_tests::run_all();
        transaction_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
