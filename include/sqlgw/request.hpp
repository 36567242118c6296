// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Request / sqlgw::TransactionItem -- the wire request.
//
// Design:
//   - Request::Parse() checks only the envelope (credentials, transaction
//     array); items stay raw JSON so that a malformed item fails at its
//     own index, under its own noFail policy
//   - TransactionItem::Parse() is the single validating constructor:
//     kind is Query or Statement, params are None, Single or Batch, and
//     every other combination is rejected with kValidation
//   - A JSON null counts as an absent field

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "sqlgw/error.hpp"
#include "sqlgw/json.hpp"

namespace sqlgw {

// ---------------------------------------------------------------------------
// Credentials
// ---------------------------------------------------------------------------

struct Credentials {
  std::string user;
  std::string password;
};

// ---------------------------------------------------------------------------
// TransactionItem
// ---------------------------------------------------------------------------

enum class ItemKind : int32_t {
  kQuery = 0,
  kStatement,
};

enum class ParamsKind : int32_t {
  kNone = 0,
  kSingle,
  kBatch,
};

class TransactionItem {
 public:
  TransactionItem() = default;

  /// Validate and build an item. `out->no_fail()` is meaningful even when
  /// validation fails, as long as the item is an object with a boolean
  /// "noFail".
  static Error Parse(const Json& json, TransactionItem* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    *out = TransactionItem{};
    if (!json.is_object()) {
      return Error::Make(ErrorCode::kValidation,
                         "Transaction item must be a JSON object");
    }

    const Json* no_fail = Field(json, "noFail");
    if (no_fail != nullptr) {
      if (!no_fail->is_boolean()) {
        return Error::Make(ErrorCode::kValidation,
                           "'noFail' must be a boolean");
      }
      out->no_fail_ = no_fail->get<bool>();
    }

    const Json* query = Field(json, "query");
    const Json* statement = Field(json, "statement");
    if ((query != nullptr) == (statement != nullptr)) {
      return Error::Make(
          ErrorCode::kValidation,
          "Exactly one of 'query' and 'statement' must be provided");
    }
    const Json* text = (query != nullptr) ? query : statement;
    if (!text->is_string()) {
      return Error::Make(ErrorCode::kValidation,
                         query != nullptr ? "'query' must be a string"
                                          : "'statement' must be a string");
    }
    out->kind_ = (query != nullptr) ? ItemKind::kQuery : ItemKind::kStatement;
    out->sql_text_ = text->get<std::string>();

    const Json* values = Field(json, "values");
    const Json* values_batch = Field(json, "valuesBatch");
    if (values != nullptr && values_batch != nullptr) {
      return Error::Make(
          ErrorCode::kValidation,
          "At most one of 'values' and 'valuesBatch' must be provided");
    }

    if (values != nullptr) {
      if (!values->is_object()) {
        return Error::Make(ErrorCode::kValidation,
                           "'values' must be a JSON object");
      }
      out->params_kind_ = ParamsKind::kSingle;
      out->values_ = *values;
    } else if (values_batch != nullptr) {
      if (out->kind_ == ItemKind::kQuery) {
        return Error::Make(ErrorCode::kValidation,
                           "'valuesBatch' is only valid for statements");
      }
      if (!values_batch->is_array()) {
        return Error::Make(ErrorCode::kValidation,
                           "'valuesBatch' must be an array of objects");
      }
      for (size_t i = 0; i < values_batch->size(); ++i) {
        const Json& entry = (*values_batch)[i];
        if (!entry.is_object()) {
          Error err;
          err.SetFormat(ErrorCode::kValidation,
                        "'valuesBatch' entry %zu must be a JSON object", i);
          return err;
        }
        out->values_batch_.push_back(entry);
      }
      out->params_kind_ = ParamsKind::kBatch;
    }
    return Error::Ok();
  }

  ItemKind kind() const { return kind_; }
  const std::string& sql_text() const { return sql_text_; }
  ParamsKind params_kind() const { return params_kind_; }
  const Json& values() const { return values_; }
  const std::vector<Json>& values_batch() const { return values_batch_; }
  bool no_fail() const { return no_fail_; }

 private:
  static const Json* Field(const Json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) { return nullptr; }
    return &*it;
  }

  ItemKind kind_ = ItemKind::kQuery;
  std::string sql_text_;
  ParamsKind params_kind_ = ParamsKind::kNone;
  Json values_;
  std::vector<Json> values_batch_;
  bool no_fail_ = false;
};

// ---------------------------------------------------------------------------
// Request
// ---------------------------------------------------------------------------

struct Request {
  bool has_credentials = false;
  Credentials credentials;
  std::vector<Json> transaction;

  static Error Parse(const Json& json, Request* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    *out = Request{};
    if (!json.is_object()) {
      return Error::Make(ErrorCode::kParse,
                         "Request body must be a JSON object");
    }

    auto creds = json.find("credentials");
    if (creds != json.end() && !creds->is_null()) {
      auto user = creds->is_object() ? creds->find("user") : creds->end();
      auto password =
          creds->is_object() ? creds->find("password") : creds->end();
      if (!creds->is_object() || user == creds->end() ||
          password == creds->end() || !user->is_string() ||
          !password->is_string()) {
        return Error::Make(ErrorCode::kParse,
                           "'credentials' must be an object with string "
                           "'user' and 'password'");
      }
      out->has_credentials = true;
      out->credentials.user = user->get<std::string>();
      out->credentials.password = password->get<std::string>();
    }

    auto transaction = json.find("transaction");
    if (transaction == json.end() || !transaction->is_array()) {
      return Error::Make(ErrorCode::kParse,
                         "'transaction' must be an array of items");
    }
    out->transaction.assign(transaction->begin(), transaction->end());
    return Error::Ok();
  }

  /// Parse a raw request body.
  static Error ParseBody(const std::string& body, Request* out) {
    Json json;
    Error err = ParseJson(body, &json);
    if (!err.ok()) { return err; }
    return Parse(json, out);
  }
};

}  // namespace sqlgw
