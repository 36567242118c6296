// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Response / sqlgw::ResponseItem -- the wire response.
//
// Success envelope:
//   {"success": true, "results": [ResponseItem...]}
// Failure envelope:
//   {"success": false, "errorCode": <item index or -1>, "message": "..."}
//
// `status` is the transport status the caller should send. The failure
// kind is kept next to it, so a transport may remap engine failures.

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "sqlgw/error.hpp"
#include "sqlgw/json.hpp"

namespace sqlgw {

// ---------------------------------------------------------------------------
// Transport status codes
// ---------------------------------------------------------------------------

constexpr int32_t kStatusOk = 200;
constexpr int32_t kStatusBadRequest = 400;
constexpr int32_t kStatusUnauthorized = 401;
constexpr int32_t kStatusNotFound = 404;
constexpr int32_t kStatusInternalError = 500;

/// errorCode for failures not attributable to one item.
constexpr int64_t kNoItemIndex = -1;

/// Status for a whole-batch abort caused by an item. Engine failures map
/// to 400 like client mistakes; ErrorKind keeps them apart.
inline int32_t StatusForItemFailure(ErrorKind kind) {
  return kind == ErrorKind::kAuth ? kStatusUnauthorized : kStatusBadRequest;
}

// ---------------------------------------------------------------------------
// ResponseItem
// ---------------------------------------------------------------------------

struct ResponseItem {
  bool success = true;
  std::string error;

  bool has_result_set = false;
  Json result_set = Json::array();

  bool has_rows_updated = false;
  int64_t rows_updated = 0;

  bool has_rows_updated_batch = false;
  std::vector<int64_t> rows_updated_batch;

  static ResponseItem Failed(const char* message) {
    ResponseItem item;
    item.success = false;
    item.error = message != nullptr ? message : "";
    return item;
  }

  Json ToJson() const {
    Json j = Json::object();
    j["success"] = success;
    if (!success) {
      j["error"] = error;
      return j;
    }
    if (has_result_set) { j["resultSet"] = result_set; }
    if (has_rows_updated) { j["rowsUpdated"] = rows_updated; }
    if (has_rows_updated_batch) {
      j["rowsUpdatedBatch"] = rows_updated_batch;
    }
    return j;
  }
};

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------

struct Response {
  int32_t status = kStatusOk;
  bool success = true;
  std::vector<ResponseItem> results;

  int64_t error_code = kNoItemIndex;
  std::string message;
  ErrorKind failure_kind = ErrorKind::kNone;

  static Response Ok(std::vector<ResponseItem> results) {
    Response r;
    r.results = std::move(results);
    return r;
  }

  static Response Fail(int32_t status, int64_t error_code,
                       const char* message, ErrorKind kind) {
    Response r;
    r.status = status;
    r.success = false;
    r.error_code = error_code;
    r.message = message != nullptr ? message : "";
    r.failure_kind = kind;
    return r;
  }

  Json ToJson() const {
    Json j = Json::object();
    j["success"] = success;
    if (success) {
      Json items = Json::array();
      for (const ResponseItem& item : results) {
        items.push_back(item.ToJson());
      }
      j["results"] = std::move(items);
    } else {
      j["errorCode"] = error_code;
      j["message"] = message;
    }
    return j;
  }

  std::string Dump(int indent = -1) const {
    return DumpJson(ToJson(), indent);
  }
};

}  // namespace sqlgw
