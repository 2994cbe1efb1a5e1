#pragma once
// Thin RAII wrappers over the sqlite3 C API shared by store, planner and search.
#include "store.hpp"
#include <sqlite3.h>
#include <string>

class Db {
public:
  Db(const std::string& path, int flags);
  ~Db();
  Db(const Db&) = delete;
  Db& operator=(const Db&) = delete;
  Db(Db&& o) noexcept : db_(o.db_) { o.db_ = nullptr; }

  sqlite3* get() const { return db_; }
  void exec(const std::string& sql);
  std::string errmsg() const { return db_ ? sqlite3_errmsg(db_) : "no connection"; }

  // read-only connection onto an existing database
  static Db reader(const std::string& path);

private:
  sqlite3* db_ = nullptr;
};

class Stmt {
public:
  Stmt(const Db& db, const char* sql);
  ~Stmt();
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;
  Stmt(Stmt&& o) noexcept : db_(o.db_), st_(o.st_) { o.st_ = nullptr; }

  void bind(int i, const std::string& v);
  void bind(int i, long long v);
  void bind(int i, int v) { bind(i, (long long)v); }
  void bind(int i, bool v) { bind(i, (long long)(v ? 1 : 0)); }

  bool step();   // true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise
  void run();    // step that must finish the statement
  void reset();

  std::string text(int col) const;
  long long int64(int col) const { return sqlite3_column_int64(st_, col); }
  int integer(int col) const { return sqlite3_column_int(st_, col); }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

// BEGIN IMMEDIATE .. COMMIT; rolls back unless commit() was reached.
class Transaction {
public:
  explicit Transaction(Db& db);
  ~Transaction();
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  void commit();

private:
  Db& db_;
  bool done_ = false;
};
