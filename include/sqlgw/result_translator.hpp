// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw result translation -- engine rows to JSON objects.
//
// Mapping (wire contract):
//   NULL     -> null
//   INTEGER  -> number (integer)
//   REAL     -> number (float)
//   TEXT     -> string
//   BLOB     -> string, padded standard base64 (see base64.hpp)
//
// A row becomes one object keyed by column name, in the engine's column
// order. With duplicate column names the key keeps its first position and
// takes the last value.

#pragma once

#include <cstdint>

#include "sqlgw/base64.hpp"
#include "sqlgw/error.hpp"
#include "sqlgw/json.hpp"
#include "sqlgw/sqlite3_query.hpp"
#include "sqlgw/value.hpp"

namespace sqlgw {

inline Json ValueToJson(const Value& value) {
  switch (value.type) {
    case ValueType::kInteger:
      return Json(value.integer);
    case ValueType::kReal:
      return Json(value.real);
    case ValueType::kText:
      return Json(value.text);
    case ValueType::kBlob:
      return Json(base64::Encode(value.blob));
    case ValueType::kNull:
      break;
  }
  return Json(nullptr);
}

/// Translate the query's current row.
inline Json RowToJson(const Sqlite3Query& q) {
  Json row = Json::object();
  for (int32_t i = 0; i < q.NumFields(); ++i) {
    const char* name = q.FieldName(i);
    row[name != nullptr ? name : ""] = ValueToJson(q.GetValue(i));
  }
  return row;
}

/// Drain the query into an array of row objects. The cursor ends at Eof().
inline Error FetchAll(Sqlite3Query& q, Json* out_rows) {
  if (out_rows == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  *out_rows = Json::array();
  Error err;
  while (!q.Eof()) {
    out_rows->push_back(RowToJson(q));
    q.NextRow(&err);
    if (!err.ok()) { return err; }
  }
  return Error::Ok();
}

}  // namespace sqlgw
