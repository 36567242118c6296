// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Transaction / sqlgw::Savepoint -- scoped transaction guards.
//
// Design:
//   - Begin() opens the scope; Commit()/Release() or Rollback() close it
//   - The destructor rolls back a scope that is still open, so no exit
//     path leaves a transaction or savepoint behind
//   - Non-copyable, non-movable: the guard lives on the caller's stack
//   - Rollback failures in the destructor are logged, never thrown

#pragma once

#include <spdlog/spdlog.h>

#include "sqlgw/error.hpp"
#include "sqlgw/sqlite3_db.hpp"

namespace sqlgw {

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

class Transaction {
 public:
  explicit Transaction(Sqlite3Db& db) : db_(db) {}

  ~Transaction() {
    if (active_) {
      Error err = Rollback();
      if (!err.ok()) {
        spdlog::error("transaction: rollback on scope exit failed: {}",
                      err.message);
      }
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  Error Begin() {
    if (active_) {
      return Error::Make(ErrorCode::kMisuse, "Transaction already open");
    }
    Error err = db_.BeginTransaction();
    active_ = err.ok();
    return err;
  }

  /// On failure the transaction stays open and is rolled back by the
  /// destructor (or an explicit Rollback()).
  Error Commit() {
    if (!active_) {
      return Error::Make(ErrorCode::kMisuse, "Transaction not open");
    }
    Error err = db_.Commit();
    if (err.ok()) { active_ = false; }
    return err;
  }

  Error Rollback() {
    if (!active_) {
      return Error::Make(ErrorCode::kMisuse, "Transaction not open");
    }
    active_ = false;
    // The engine may already have rolled back on its own (e.g. SQLITE_FULL).
    if (!db_.InTransaction()) { return Error::Ok(); }
    return db_.Rollback();
  }

  bool Active() const { return active_; }

 private:
  Sqlite3Db& db_;
  bool active_ = false;
};

// ---------------------------------------------------------------------------
// Savepoint
// ---------------------------------------------------------------------------

class Savepoint {
 public:
  Savepoint(Sqlite3Db& db, const char* name) : db_(db), name_(name) {}

  ~Savepoint() {
    if (active_) {
      Error err = Rollback();
      if (!err.ok()) {
        spdlog::error("savepoint {}: rollback on scope exit failed: {}",
                      name_, err.message);
      }
    }
  }

  Savepoint(const Savepoint&) = delete;
  Savepoint& operator=(const Savepoint&) = delete;

  Error Begin() {
    if (active_) {
      return Error::Make(ErrorCode::kMisuse, "Savepoint already open");
    }
    Error err = db_.Savepoint(name_);
    active_ = err.ok();
    return err;
  }

  Error Release() {
    if (!active_) {
      return Error::Make(ErrorCode::kMisuse, "Savepoint not open");
    }
    Error err = db_.ReleaseSavepoint(name_);
    if (err.ok()) { active_ = false; }
    return err;
  }

  /// Undo everything since Begin() and drop the savepoint. The enclosing
  /// transaction stays open.
  Error Rollback() {
    if (!active_) {
      return Error::Make(ErrorCode::kMisuse, "Savepoint not open");
    }
    active_ = false;
    if (!db_.InTransaction()) { return Error::Ok(); }
    Error err = db_.RollbackToSavepoint(name_);
    if (!err.ok()) { return err; }
    return db_.ReleaseSavepoint(name_);
  }

  bool Active() const { return active_; }

 private:
  Sqlite3Db& db_;
  const char* name_;
  bool active_ = false;
};

}  // namespace sqlgw
