// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::StatementRegistry -- named, pre-declared SQL.
//
// Design:
//   - Built once from the database configuration, immutable afterwards,
//     so concurrent readers need no locking
//   - Lookup by exact name
//   - ResolveSql() turns an item's text into the SQL to run:
//       "^name"        -> registered SQL, error if unknown
//       "name"         -> registered SQL when registered
//       anything else  -> the text itself, unless stored-only is set

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>

#include "sqlgw/error.hpp"

namespace sqlgw {

// ---------------------------------------------------------------------------
// StatementRegistry
// ---------------------------------------------------------------------------

class StatementRegistry {
 public:
  StatementRegistry() = default;

  explicit StatementRegistry(std::map<std::string, std::string> statements)
      : statements_(std::move(statements)) {}

  /// Registered SQL for `name`, or nullptr.
  const std::string* Find(const std::string& name) const {
    auto it = statements_.find(name);
    return it != statements_.end() ? &it->second : nullptr;
  }

  size_t Size() const { return statements_.size(); }
  bool Empty() const { return statements_.empty(); }

 private:
  std::map<std::string, std::string> statements_;
};

// ---------------------------------------------------------------------------
// ResolveSql
// ---------------------------------------------------------------------------

/// Prefix marking an explicit reference to a stored statement.
constexpr char kStoredStatementMarker = '^';

/// On success *out_sql points either into `registry` or at `text`.
inline Error ResolveSql(const std::string& text,
                        const StatementRegistry& registry, bool stored_only,
                        const std::string** out_sql) {
  if (out_sql == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out_sql is null");
  }
  *out_sql = nullptr;

  if (!text.empty() && text[0] == kStoredStatementMarker) {
    const std::string* sql = registry.Find(text.substr(1));
    if (sql == nullptr) {
      Error err;
      err.SetFormat(ErrorCode::kResolution, "Stored statement '%s' not found",
                    text.c_str() + 1);
      return err;
    }
    *out_sql = sql;
    return Error::Ok();
  }

  const std::string* sql = registry.Find(text);
  if (sql != nullptr) {
    *out_sql = sql;
    return Error::Ok();
  }
  if (stored_only) {
    return Error::Make(ErrorCode::kResolution,
                       "Only stored statements are allowed on this database, "
                       "and no stored statement matches");
  }
  *out_sql = &text;
  return Error::Ok();
}

}  // namespace sqlgw
