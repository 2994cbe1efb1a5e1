#include "sqlite_db.hpp"
#include <iostream>

Db::Db(const std::string& path, int flags) {
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string e = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("sqlite open failed: " + path + ": " + e);
  }
  sqlite3_busy_timeout(db_, 30000);
}

Db::~Db() {
  if (db_) sqlite3_close(db_);
}

Db Db::reader(const std::string& path) {
  return Db(path, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX);
}

void Db::exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    throw StoreError("sqlite exec: " + e);
  }
}

Stmt::Stmt(const Db& db, const char* sql) : db_(db.get()) {
  if (sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr) != SQLITE_OK)
    throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
}

Stmt::~Stmt() {
  if (st_) sqlite3_finalize(st_);
}

void Stmt::bind(int i, const std::string& v) {
  if (sqlite3_bind_text(st_, i, v.c_str(), (int)v.size(), SQLITE_TRANSIENT) != SQLITE_OK)
    throw StoreError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
}

void Stmt::bind(int i, long long v) {
  if (sqlite3_bind_int64(st_, i, (sqlite3_int64)v) != SQLITE_OK)
    throw StoreError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
}

bool Stmt::step() {
  int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
}

void Stmt::run() {
  while (step()) {}
}

void Stmt::reset() {
  sqlite3_reset(st_);
  sqlite3_clear_bindings(st_);
}

std::string Stmt::text(int col) const {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st_, col));
  return p ? std::string(p, (size_t)sqlite3_column_bytes(st_, col)) : std::string();
}

Transaction::Transaction(Db& db) : db_(db) {
  db_.exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
  if (done_) return;
  char* err = nullptr;
  if (sqlite3_exec(db_.get(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
    std::cerr << "[store] rollback failed: " << (err ? err : "unknown") << "\n";
    sqlite3_free(err);
  }
}

void Transaction::commit() {
  db_.exec("COMMIT");
  done_ = true;
}
