// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - 1-based positional binding (matches SQLite3 convention) and
//     name-based binding of sqlgw::NamedParams
//   - ExecDml() for INSERT/UPDATE/DELETE/DDL, ExecQuery() for SELECT
//   - ExecDml() resets the statement, so one compiled statement can be
//     executed repeatedly with fresh bindings

#pragma once

#include <cstdint>
#include <string>

#include "sqlite3.h"

#include "sqlgw/error.hpp"
#include "sqlgw/sqlite3_query.hpp"
#include "sqlgw/value.hpp"

namespace sqlgw {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  // Move
  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  // --- Execute ---

  /// Execute DML/DDL. Returns affected row count, or -1 on error.
  /// A statement that produces rows is rejected: rows are only
  /// fetched through ExecQuery().
  int64_t ExecDml(Error* out_error = nullptr) {
    if (db_ == nullptr || stmt_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
      }
      return -1;
    }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE) {
      int64_t changes = sqlite3_changes(db_);
      int32_t reset_rc = sqlite3_reset(stmt_);
      if (reset_rc != SQLITE_OK) {
        if (out_error != nullptr) {
          *out_error = Error::FromSqlite(db_, reset_rc);
        }
        return -1;
      }
      return changes;
    }

    if (rc == SQLITE_ROW) {
      sqlite3_reset(stmt_);
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse,
                       "Statement returned rows; send it as a query");
      }
      return -1;
    }

    Error err = Error::FromSqlite(db_, rc);
    sqlite3_reset(stmt_);
    if (out_error != nullptr) { *out_error = err; }
    return -1;
  }

  /// Execute SELECT query. Returns Sqlite3Query for iteration.
  /// Note: after ExecQuery(), the statement handle is transferred to
  /// the returned Sqlite3Query. This statement becomes empty.
  Sqlite3Query ExecQuery(Error* out_error = nullptr) {
    if (db_ == nullptr || stmt_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
      }
      return Sqlite3Query{};
    }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
      Sqlite3Query q(db_, stmt_, rc == SQLITE_DONE);
      stmt_ = nullptr;  // ownership transferred
      return q;
    }

    Error err = Error::FromSqlite(db_, rc);
    sqlite3_reset(stmt_);
    if (out_error != nullptr) { *out_error = err; }
    return Sqlite3Query{};
  }

  // --- Bind (1-based index) ---

  Error Bind(int32_t param, const char* value) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    return Check(sqlite3_bind_text(stmt_, param, value, -1,
                                   SQLITE_TRANSIENT));
  }

  Error Bind(int32_t param, const std::string& value) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    return Check(sqlite3_bind_text(stmt_, param, value.data(),
                                   static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT));
  }

  Error Bind(int32_t param, int32_t value) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    return Check(sqlite3_bind_int(stmt_, param, value));
  }

  Error Bind(int32_t param, int64_t value) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    return Check(sqlite3_bind_int64(stmt_, param, value));
  }

  Error Bind(int32_t param, double value) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    return Check(sqlite3_bind_double(stmt_, param, value));
  }

  Error Bind(int32_t param, const uint8_t* blob, int32_t len) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    return Check(sqlite3_bind_blob(stmt_, param, blob, len,
                                   SQLITE_TRANSIENT));
  }

  Error BindNull(int32_t param) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    return Check(sqlite3_bind_null(stmt_, param));
  }

  Error Bind(int32_t param, const Value& value) {
    switch (value.type) {
      case ValueType::kInteger:
        return Bind(param, value.integer);
      case ValueType::kReal:
        return Bind(param, value.real);
      case ValueType::kText:
        return Bind(param, value.text);
      case ValueType::kBlob:
        return Bind(param, value.blob.data(),
                    static_cast<int32_t>(value.blob.size()));
      case ValueType::kNull:
        break;
    }
    return BindNull(param);
  }

  // --- Bind by name ---

  /// 1-based index of a named parameter (":v", "@v", "$v"), 0 if absent.
  int32_t ParamIndex(const char* name) const {
    if (stmt_ == nullptr || name == nullptr) { return 0; }
    return sqlite3_bind_parameter_index(stmt_, name);
  }

  int32_t ParamCount() const {
    if (stmt_ == nullptr) { return 0; }
    return sqlite3_bind_parameter_count(stmt_);
  }

  /// Bind every parameter by name. A name the statement does not
  /// declare is an error; declared parameters left out stay NULL.
  Error Bind(const NamedParams& params) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    for (const NamedParam& p : params) {
      int32_t idx = ParamIndex(p.name.c_str());
      if (idx == 0) {
        Error err;
        err.SetFormat(ErrorCode::kRange, "Invalid parameter name: %s",
                      p.name.c_str());
        return err;
      }
      Error err = Bind(idx, p.value);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  Error ClearBindings() {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    return Check(sqlite3_clear_bindings(stmt_));
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class Sqlite3Db;

  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {}

  Error Check(int32_t rc) const {
    if (rc == SQLITE_OK) { return Error::Ok(); }
    return Error::FromSqlite(db_, rc);
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace sqlgw
