// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Value -- typed engine value and named parameters.
//
// Design:
//   - Mirrors the SQLite3 storage classes: null, integer, real, text, blob
//   - Plain value type, copyable and movable
//   - NamedParam pairs a parameter name (with its ':', '@' or '$' prefix)
//     with the value bound to it

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sqlgw {

// ---------------------------------------------------------------------------
// ValueType
// ---------------------------------------------------------------------------

enum class ValueType : int32_t {
  kNull = 0,
  kInteger,
  kReal,
  kText,
  kBlob,
};

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

struct Value {
  ValueType type = ValueType::kNull;
  int64_t integer = 0;
  double real = 0.0;
  std::string text;
  std::vector<uint8_t> blob;

  bool IsNull() const { return type == ValueType::kNull; }

  static Value Null() { return Value{}; }

  static Value Integer(int64_t v) {
    Value val;
    val.type = ValueType::kInteger;
    val.integer = v;
    return val;
  }

  static Value Real(double v) {
    Value val;
    val.type = ValueType::kReal;
    val.real = v;
    return val;
  }

  static Value Text(std::string v) {
    Value val;
    val.type = ValueType::kText;
    val.text = std::move(v);
    return val;
  }

  static Value Blob(std::vector<uint8_t> v) {
    Value val;
    val.type = ValueType::kBlob;
    val.blob = std::move(v);
    return val;
  }
};

// ---------------------------------------------------------------------------
// NamedParam
// ---------------------------------------------------------------------------

struct NamedParam {
  std::string name;
  Value value;
};

using NamedParams = std::vector<NamedParam>;

}  // namespace sqlgw
