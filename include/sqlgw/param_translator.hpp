// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw parameter translation -- JSON parameter object to NamedParams.
//
// Mapping (the only JSON -> engine coercion in the gateway):
//   null            -> NULL
//   true / false    -> INTEGER 1 / 0
//   integer number  -> INTEGER (unsigned values above INT64_MAX rejected)
//   float number    -> REAL
//   string          -> TEXT
//   array / object  -> kTranslation error
//
// Keys are parameter names. A key starting with ':', '@' or '$' is used
// as-is; any other key gets a ':' prefix ("v" binds ":v").

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include "sqlgw/error.hpp"
#include "sqlgw/json.hpp"
#include "sqlgw/value.hpp"

namespace sqlgw {

inline std::string ParamName(const std::string& key) {
  if (!key.empty() && (key[0] == ':' || key[0] == '@' || key[0] == '$')) {
    return key;
  }
  return ":" + key;
}

/// Translate one JSON scalar. `name` only feeds the error message.
inline Error TranslateValue(const std::string& name, const Json& json,
                            Value* out) {
  switch (json.type()) {
    case Json::value_t::null:
      *out = Value::Null();
      return Error::Ok();
    case Json::value_t::boolean:
      *out = Value::Integer(json.get<bool>() ? 1 : 0);
      return Error::Ok();
    case Json::value_t::number_integer:
      *out = Value::Integer(json.get<int64_t>());
      return Error::Ok();
    case Json::value_t::number_unsigned: {
      uint64_t v = json.get<uint64_t>();
      if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        Error err;
        err.SetFormat(ErrorCode::kTranslation,
                      "Parameter '%s': integer out of 64-bit signed range",
                      name.c_str());
        return err;
      }
      *out = Value::Integer(static_cast<int64_t>(v));
      return Error::Ok();
    }
    case Json::value_t::number_float:
      *out = Value::Real(json.get<double>());
      return Error::Ok();
    case Json::value_t::string:
      *out = Value::Text(json.get<std::string>());
      return Error::Ok();
    default:
      break;
  }
  Error err;
  err.SetFormat(ErrorCode::kTranslation,
                "Parameter '%s': %s values cannot be bound, only scalars",
                name.c_str(), json.type_name());
  return err;
}

inline Error TranslateParams(const Json& params, NamedParams* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  out->clear();
  if (!params.is_object()) {
    return Error::Make(ErrorCode::kTranslation,
                       "Parameters must be a JSON object");
  }
  out->reserve(params.size());
  for (auto it = params.begin(); it != params.end(); ++it) {
    NamedParam p;
    p.name = ParamName(it.key());
    Error err = TranslateValue(it.key(), it.value(), &p.value);
    if (!err.ok()) { return err; }
    out->push_back(std::move(p));
  }
  return Error::Ok();
}

}  // namespace sqlgw
