// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Json -- JSON document type used on the wire.
//
// Design:
//   - nlohmann::ordered_json, so result rows keep the engine's column order
//   - ParseJson() never throws: malformed input yields kParse
//   - DumpJson() never throws: invalid UTF-8 is replaced, not rejected

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sqlgw/error.hpp"

namespace sqlgw {

using Json = nlohmann::ordered_json;

inline Error ParseJson(const std::string& text, Json* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  *out = Json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (out->is_discarded()) {
    return Error::Make(ErrorCode::kParse, "Malformed JSON");
  }
  return Error::Ok();
}

inline std::string DumpJson(const Json& j, int indent = -1) {
  return j.dump(indent, ' ', false, Json::error_handler_t::replace);
}

}  // namespace sqlgw
