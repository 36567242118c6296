// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Sqlite3Db -- SQLite3 database connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - Transaction support (Begin/Commit/Rollback) and named savepoints
//   - Compiled statements hold exactly one SQL statement
//   - Transaction control can be locked out of compiled statements, so
//     only the owner of the connection begins and ends transactions
//   - Zero global state, thread-safe per connection

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>

#include "sqlite3.h"

#include "sqlgw/error.hpp"
#include "sqlgw/sqlite3_query.hpp"
#include "sqlgw/sqlite3_statement.hpp"

namespace sqlgw {

// ---------------------------------------------------------------------------
// Sqlite3Db
// ---------------------------------------------------------------------------

class Sqlite3Db {
 public:
  Sqlite3Db() = default;

  ~Sqlite3Db() { Close(); }

  // Move
  Sqlite3Db(Sqlite3Db&& other) noexcept
      : db_(other.db_), txn_control_allowed_(other.txn_control_allowed_) {
    other.db_ = nullptr;
    other.txn_control_allowed_ = true;
  }

  Sqlite3Db& operator=(Sqlite3Db&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      txn_control_allowed_ = other.txn_control_allowed_;
      other.db_ = nullptr;
      other.txn_control_allowed_ = true;
    }
    return *this;
  }

  // No copy
  Sqlite3Db(const Sqlite3Db&) = delete;
  Sqlite3Db& operator=(const Sqlite3Db&) = delete;

  // --- Open / Close ---

  /// Open (creating if needed) a database file. With read_only the file
  /// must exist and every write fails with kReadOnly.
  Error Open(const char* path, bool read_only = false) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Close();
    int32_t flags = read_only ? SQLITE_OPEN_READONLY
                              : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int32_t rc = sqlite3_open_v2(path, &db_, flags | SQLITE_OPEN_URI,
                                 nullptr);
    if (rc != SQLITE_OK) {
      Error err = db_ != nullptr
                      ? Error::FromSqlite(db_, rc)
                      : Error::Make(ErrorCode::kError, "sqlite3_open failed");
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    sqlite3_extended_result_codes(db_, 1);
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    txn_control_allowed_ = true;
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- DML ---

  /// Execute one or more semicolon-separated statements without results
  /// (CREATE/DROP/INSERT/UPDATE/DELETE/PRAGMA).
  /// Returns number of rows affected by the last one, or -1 on error.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return -1;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return -1;
    }

    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
      return sqlite3_changes(db_);
    }

    if (out_error != nullptr) {
      out_error->Set(ErrorCodeFromSqlite(rc),
                     errmsg ? errmsg : sqlite3_errmsg(db_));
    }
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return -1;
  }

  // --- Scalar query ---

  /// First column of the first row as an integer (e.g. SELECT count(*)).
  /// Returns null_value for NULL, no rows, or an error.
  int64_t ExecScalar(const char* sql, int64_t null_value = 0,
                     Error* out_error = nullptr) {
    Error err;
    Sqlite3Query q = ExecQuery(sql, &err);
    if (!err.ok() || q.Eof() || q.NumFields() < 1) {
      if (out_error != nullptr) {
        if (err.ok()) { err.Set(ErrorCode::kError, "Invalid scalar query"); }
        *out_error = err;
      }
      return null_value;
    }
    return q.GetInt64(0, null_value);
  }

  // --- Query ---

  /// Execute SELECT query. Returns Sqlite3Query for forward iteration.
  Sqlite3Query ExecQuery(const char* sql, Error* out_error = nullptr) {
    Sqlite3Statement stmt = CompileStatement(sql, out_error);
    if (!stmt.Valid()) { return Sqlite3Query{}; }
    return stmt.ExecQuery(out_error);
  }

  // --- Statement ---

  /// Compile a prepared statement. The SQL must hold exactly one
  /// statement; empty SQL and trailing statements are rejected.
  Sqlite3Statement CompileStatement(const char* sql,
                                    Error* out_error = nullptr) {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return Sqlite3Statement{};
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return Sqlite3Statement{};
    }

    sqlite3_stmt* stmt = Compile(sql, out_error);
    if (stmt == nullptr) { return Sqlite3Statement{}; }
    return Sqlite3Statement(db_, stmt);
  }

  // --- Transaction ---

  Error BeginTransaction() {
    Error err;
    ExecDml("BEGIN TRANSACTION;", &err);
    return err;
  }

  Error Commit() {
    Error err;
    ExecDml("COMMIT TRANSACTION;", &err);
    return err;
  }

  Error Rollback() {
    Error err;
    ExecDml("ROLLBACK;", &err);
    return err;
  }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  // --- Savepoints (name must be a plain SQL identifier) ---

  Error Savepoint(const char* name) {
    return ExecNamed("SAVEPOINT %s;", name);
  }

  Error ReleaseSavepoint(const char* name) {
    return ExecNamed("RELEASE SAVEPOINT %s;", name);
  }

  Error RollbackToSavepoint(const char* name) {
    return ExecNamed("ROLLBACK TRANSACTION TO SAVEPOINT %s;", name);
  }

  /// While disallowed, compiling BEGIN, COMMIT, END, ROLLBACK, SAVEPOINT
  /// or RELEASE fails with kMisuse. Covers ExecDml and ExecQuery too, so
  /// re-allow before calling the transaction methods above.
  void AllowTransactionControl(bool allowed) {
    if (db_ == nullptr) { return; }
    sqlite3_set_authorizer(db_, allowed ? nullptr : &DenyTransactionControl,
                           nullptr);
    txn_control_allowed_ = allowed;
  }

  bool TransactionControlAllowed() const { return txn_control_allowed_; }

  // --- Misc ---

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }

 private:
  sqlite3_stmt* Compile(const char* sql, Error* out_error) {
    const char* tail = nullptr;
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, &tail);
    if (rc == SQLITE_AUTH && !txn_control_allowed_) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse,
                       "Transaction control statements are not allowed");
      }
      return nullptr;
    }
    if (rc != SQLITE_OK) {
      if (out_error != nullptr) { *out_error = Error::FromSqlite(db_, rc); }
      return nullptr;
    }
    if (stmt == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "SQL holds no statement");
      }
      return nullptr;
    }
    if (HasMoreStatements(tail)) {
      sqlite3_finalize(stmt);
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse,
                       "Multiple statements provided; only one is allowed");
      }
      return nullptr;
    }
    return stmt;
  }

  // True if the remaining SQL compiles to another statement, or fails to
  // compile at all.
  bool HasMoreStatements(const char* tail) {
    if (tail == nullptr || *tail == '\0') { return false; }
    sqlite3_stmt* next = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, tail, -1, &next, nullptr);
    if (next != nullptr) {
      sqlite3_finalize(next);
      return true;
    }
    return rc != SQLITE_OK;
  }

  static int DenyTransactionControl(void* /*user*/, int action,
                                    const char* /*arg1*/,
                                    const char* /*arg2*/,
                                    const char* /*db_name*/,
                                    const char* /*trigger*/) {
    if (action == SQLITE_TRANSACTION || action == SQLITE_SAVEPOINT) {
      return SQLITE_DENY;
    }
    return SQLITE_OK;
  }

  Error ExecNamed(const char* fmt, const char* name) {
    if (name == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "name is null");
    }
    char sql[128];
    std::snprintf(sql, sizeof(sql), fmt, name);
    Error err;
    ExecDml(sql, &err);
    return err;
  }

  sqlite3* db_ = nullptr;
  bool txn_control_allowed_ = true;
};

}  // namespace sqlgw
