#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "util/Error.hpp"

namespace skynode::store {

// Prepared statement. Bind indices are 1-based, column indices 0-based.
class Statement {
public:
  Statement(Statement&&) noexcept = default;
  Statement& operator=(Statement&&) noexcept = default;

  Statement& bind(int index, int64_t value);
  Statement& bind(int index, double value);
  Statement& bind(int index, std::string_view value);
  Statement& bind_null(int index);

  // true when a row is available, false when the statement is done.
  [[nodiscard]] util::Result<bool> step();
  void reset();

  [[nodiscard]] int64_t column_int64(int index) const;
  [[nodiscard]] double column_double(int index) const;
  [[nodiscard]] std::string column_text(int index) const;
  [[nodiscard]] bool column_is_null(int index) const;

private:
  friend class Database;
  struct Finalizer { void operator()(sqlite3_stmt* s) const { sqlite3_finalize(s); } };
  Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

  sqlite3* db_{nullptr};
  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
};

class Database {
  struct Key { explicit Key() = default; };

public:
  Database(Key, sqlite3* db) : db_(db) {}

  // Opens (creating if needed) the file and switches it to WAL journaling.
  [[nodiscard]] static util::Result<std::unique_ptr<Database>> open(const std::string& path);
  ~Database();
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  [[nodiscard]] util::Result<void> exec(std::string_view sql);
  [[nodiscard]] util::Result<Statement> prepare(std::string_view sql);

private:
  sqlite3* db_;
};

// Rolls back unless commit() succeeded.
class Transaction {
public:
  explicit Transaction(Database& db) : db_(db) {}
  ~Transaction();
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  [[nodiscard]] util::Result<void> begin();
  [[nodiscard]] util::Result<void> commit();

private:
  Database& db_;
  bool open_{false};
};

} // namespace skynode::store
