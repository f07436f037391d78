#pragma once

// StableSQL - SQLite persisted in a growable linear-memory region
//
// Usage:
//   #include <StableSQL.hpp>
//
//   int main() {
//       auto memory = std::make_shared<stablesql::heap_memory>();
//       auto db = stablesql::builder::with_memory(memory).build();
//       auto conn = db.connect();
//
//       conn.execute("CREATE TABLE users (email TEXT)");
//       conn.execute("INSERT INTO users VALUES (?1)", stablesql::params_of("alice@example.org"));
//
//       auto rows = conn.query("SELECT email FROM users");
//       while (auto row = rows.next()) {
//           std::cout << row->get<std::string>(0) << std::endl;
//       }
//
//       auto tx = conn.transaction();
//       tx.execute("DELETE FROM users");
//       tx.commit();
//   }

#include "stablesql/log.hpp"
#include "stablesql/error.hpp"
#include "stablesql/types.hpp"
#include "stablesql/memory.hpp"
#include "stablesql/context.hpp"
#include "stablesql/completion.hpp"
#include "stablesql/stable_io.hpp"
#include "stablesql/engine.hpp"
#include "stablesql/config.hpp"
#include "stablesql/db.hpp"
#include "stablesql/transaction.hpp"
