// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer
//   - Compatible with -fno-exceptions
//   - Maps SQLite3 result codes to sqlgw error codes
//   - ErrorKind groups codes the way the gateway reports them

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include "sqlite3.h"

namespace sqlgw {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,

  // Engine
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,
  kReadOnly = -12,

  // Gateway
  kValidation = -20,
  kResolution = -21,
  kTranslation = -22,
  kAuth = -23,
  kParse = -24,
};

// ---------------------------------------------------------------------------
// ErrorKind
// ---------------------------------------------------------------------------

enum class ErrorKind : int32_t {
  kNone = 0,
  kValidation,
  kResolution,
  kTranslation,
  kEngine,
  kAuth,
};

inline ErrorKind KindOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return ErrorKind::kNone;
    case ErrorCode::kValidation:
    case ErrorCode::kParse:
      return ErrorKind::kValidation;
    case ErrorCode::kResolution:
      return ErrorKind::kResolution;
    case ErrorCode::kTranslation:
      return ErrorKind::kTranslation;
    case ErrorCode::kAuth:
      return ErrorKind::kAuth;
    default:
      return ErrorKind::kEngine;
  }
}

inline const char* KindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:        return "none";
    case ErrorKind::kValidation:  return "validation";
    case ErrorKind::kResolution:  return "resolution";
    case ErrorKind::kTranslation: return "translation";
    case ErrorKind::kEngine:      return "engine";
    case ErrorKind::kAuth:        return "auth";
  }
  return "unknown";
}

/// Map a SQLite3 result code (primary or extended) to an ErrorCode.
inline ErrorCode ErrorCodeFromSqlite(int32_t rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return ErrorCode::kOk;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::kBusy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::kConstraint;
    case SQLITE_MISMATCH:
      return ErrorCode::kMismatch;
    case SQLITE_MISUSE:
      return ErrorCode::kMisuse;
    case SQLITE_RANGE:
      return ErrorCode::kRange;
    case SQLITE_IOERR:
      return ErrorCode::kIoError;
    case SQLITE_FULL:
      return ErrorCode::kFull;
    case SQLITE_READONLY:
      return ErrorCode::kReadOnly;
    case SQLITE_NOTFOUND:
      return ErrorCode::kNotFound;
    default:
      return ErrorCode::kError;
  }
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  ErrorKind kind() const { return KindOf(code); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  /// Engine error built from a result code and the connection's message.
  static Error FromSqlite(sqlite3* db, int32_t rc) {
    ErrorCode c = ErrorCodeFromSqlite(rc);
    Error e;
    e.Set(c == ErrorCode::kOk ? ErrorCode::kError : c,
          db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    return e;
  }
};

}  // namespace sqlgw
