// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Sqlite3Query -- forward-only cursor over a result set.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Forward iteration via Eof()/NextRow()
//   - Step errors are reported, not folded into Eof()
//   - Columns are read as a typed sqlgw::Value following the row's
//     storage class; GetInt64() serves scalar lookups

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sqlite3.h"

#include "sqlgw/error.hpp"
#include "sqlgw/value.hpp"

namespace sqlgw {

class Sqlite3Db;
class Sqlite3Statement;

// ---------------------------------------------------------------------------
// Sqlite3Query
// ---------------------------------------------------------------------------

class Sqlite3Query {
 public:
  Sqlite3Query() = default;

  ~Sqlite3Query() { Finalize(); }

  // Move
  Sqlite3Query(Sqlite3Query&& other) noexcept
      : db_(other.db_),
        stmt_(other.stmt_),
        eof_(other.eof_),
        num_fields_(other.num_fields_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  Sqlite3Query& operator=(Sqlite3Query&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  Sqlite3Query(const Sqlite3Query&) = delete;
  Sqlite3Query& operator=(const Sqlite3Query&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  const char* FieldName(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    return sqlite3_column_name(stmt_, col);
  }

  /// SQLite storage class of the current row's column (SQLITE_INTEGER...).
  int32_t FieldDataType(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) { return -1; }
    return sqlite3_column_type(stmt_, col);
  }

  bool FieldIsNull(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) { return true; }
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  // --- Typed accessors ---

  /// Integer view of the column (SQLite's own conversion); null_value
  /// for NULL.
  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_int64(stmt_, col);
  }

  const uint8_t* GetBlob(int32_t col, int32_t& out_len) const {
    out_len = 0;
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    const uint8_t* data =
        static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
    out_len = sqlite3_column_bytes(stmt_, col);
    return data;
  }

  /// Current row's column as a typed value, following its storage class.
  Value GetValue(int32_t col) const {
    switch (FieldDataType(col)) {
      case SQLITE_INTEGER:
        return Value::Integer(sqlite3_column_int64(stmt_, col));
      case SQLITE_FLOAT:
        return Value::Real(sqlite3_column_double(stmt_, col));
      case SQLITE_TEXT: {
        const char* text =
            reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        int32_t len = sqlite3_column_bytes(stmt_, col);
        return Value::Text(text != nullptr ? std::string(text, len)
                                           : std::string());
      }
      case SQLITE_BLOB: {
        int32_t len = 0;
        const uint8_t* data = GetBlob(col, len);
        if (data == nullptr || len <= 0) { return Value::Blob({}); }
        return Value::Blob(std::vector<uint8_t>(data, data + len));
      }
      default:
        return Value::Null();
    }
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  /// Advance to the next row. On a step error the cursor ends and the
  /// error is written to out_error.
  void NextRow(Error* out_error = nullptr) {
    if (stmt_ == nullptr) { return; }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) { return; }
    eof_ = true;
    if (rc != SQLITE_DONE && out_error != nullptr) {
      *out_error = Error::FromSqlite(db_, rc);
    }
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    eof_ = true;
    num_fields_ = 0;
  }

 private:
  friend class Sqlite3Db;
  friend class Sqlite3Statement;

  Sqlite3Query(sqlite3* db, sqlite3_stmt* stmt, bool eof)
      : db_(db), stmt_(stmt), eof_(eof) {
    if (stmt_ != nullptr) {
      num_fields_ = sqlite3_column_count(stmt_);
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
};

}  // namespace sqlgw
