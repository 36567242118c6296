// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::Orchestrator -- runs one request inside one transaction.
//
// Design:
//   - Borrows an exclusively held connection and its DbConfig for the
//     duration of Run(); owns nothing
//   - Auth gate first: a rejected request opens no transaction and
//     executes no SQL
//   - Items run strictly in input order. A failing item either aborts
//     the batch (default) or, with noFail, is recorded and skipped
//   - A noFail item runs inside a savepoint, so its failure leaves no
//     partial effects and earlier items stay visible to later ones
//   - Client SQL may not begin, end or savepoint transactions; only the
//     orchestrator controls the transaction boundary
//   - Exactly one terminal decision per Run(): commit with results, or
//     rollback with the failing index. The Transaction guard rolls back
//     on any path that did not commit

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "sqlgw/auth.hpp"
#include "sqlgw/db_config.hpp"
#include "sqlgw/error.hpp"
#include "sqlgw/json.hpp"
#include "sqlgw/param_translator.hpp"
#include "sqlgw/request.hpp"
#include "sqlgw/response.hpp"
#include "sqlgw/result_translator.hpp"
#include "sqlgw/sqlite3_db.hpp"
#include "sqlgw/statement_resolver.hpp"
#include "sqlgw/transaction.hpp"

namespace sqlgw {

// ---------------------------------------------------------------------------
// Orchestrator
// ---------------------------------------------------------------------------

class Orchestrator {
 public:
  Orchestrator(Sqlite3Db& db, const DbConfig& config)
      : db_(db), config_(config) {}

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  /// `transport_credentials` are the credentials the transport extracted
  /// (HTTP basic auth); null when there are none.
  Response Run(const Request& request,
               const Credentials* transport_credentials = nullptr) {
    if (config_.has_auth) {
      Error err = Authorize(
          config_.auth, db_,
          request.has_credentials ? &request.credentials : nullptr,
          transport_credentials);
      if (!err.ok()) {
        return Response::Fail(kStatusUnauthorized, kNoItemIndex, err.message,
                              ErrorKind::kAuth);
      }
    }

    Transaction txn(db_);
    Error err = txn.Begin();
    if (!err.ok()) {
      spdlog::error("orchestrator: cannot begin transaction: {}",
                    err.message);
      return Response::Fail(kStatusInternalError, kNoItemIndex, err.message,
                            err.kind());
    }

    std::vector<ResponseItem> results;
    results.reserve(request.transaction.size());

    for (size_t idx = 0; idx < request.transaction.size(); ++idx) {
      TransactionItem item;
      ResponseItem result;
      err = TransactionItem::Parse(request.transaction[idx], &item);
      if (err.ok()) {
        err = item.no_fail() ? ExecuteIsolated(item, &result)
                             : Execute(item, &result);
      }

      if (err.ok()) {
        spdlog::debug("orchestrator: item {} ok", idx);
        results.push_back(std::move(result));
        continue;
      }

      // The engine may abort the whole transaction on its own (SQLITE_FULL,
      // SQLITE_NOMEM...). Nothing can continue after that.
      bool txn_lost = !db_.InTransaction();
      if (item.no_fail() && !txn_lost) {
        spdlog::warn("orchestrator: item {} failed, continuing: {}", idx,
                     err.message);
        results.push_back(ResponseItem::Failed(err.message));
        continue;
      }

      spdlog::warn("orchestrator: item {} failed, rolling back: {}", idx,
                   err.message);
      Error rb = txn.Rollback();
      if (!rb.ok()) {
        spdlog::error("orchestrator: rollback failed: {}", rb.message);
      }
      return Response::Fail(StatusForItemFailure(err.kind()),
                            static_cast<int64_t>(idx), err.message,
                            err.kind());
    }

    err = txn.Commit();
    if (!err.ok()) {
      spdlog::error("orchestrator: commit failed: {}", err.message);
      return Response::Fail(kStatusInternalError, kNoItemIndex, err.message,
                            err.kind());
    }
    spdlog::debug("orchestrator: committed {} item(s)", results.size());
    return Response::Ok(std::move(results));
  }

 private:
  static constexpr const char* kItemSavepoint = "sqlgw_item";

  Error ExecuteIsolated(const TransactionItem& item, ResponseItem* out) {
    Savepoint sp(db_, kItemSavepoint);
    Error err = sp.Begin();
    if (!err.ok()) { return err; }
    err = Execute(item, out);
    if (!err.ok()) {
      Error rb = sp.Rollback();
      if (!rb.ok()) {
        spdlog::error("orchestrator: savepoint rollback failed: {}",
                      rb.message);
      }
      return err;
    }
    return sp.Release();
  }

  Error Execute(const TransactionItem& item, ResponseItem* out) {
    const std::string* sql = nullptr;
    Error err = ResolveSql(item.sql_text(), config_.stored_statements,
                           config_.use_only_stored_statements, &sql);
    if (!err.ok()) { return err; }

    if (item.kind() == ItemKind::kQuery) {
      return DoQuery(*sql, item, out);
    }
    return DoStatement(*sql, item, out);
  }

  Sqlite3Statement CompileItem(const std::string& sql, Error* out_error) {
    db_.AllowTransactionControl(false);
    Sqlite3Statement stmt = db_.CompileStatement(sql.c_str(), out_error);
    db_.AllowTransactionControl(true);
    return stmt;
  }

  Error DoQuery(const std::string& sql, const TransactionItem& item,
                ResponseItem* out) {
    NamedParams params;
    if (item.params_kind() == ParamsKind::kSingle) {
      Error err = TranslateParams(item.values(), &params);
      if (!err.ok()) { return err; }
    }

    Error err;
    Sqlite3Statement stmt = CompileItem(sql, &err);
    if (!err.ok()) { return err; }
    err = stmt.Bind(params);
    if (!err.ok()) { return err; }

    Sqlite3Query q = stmt.ExecQuery(&err);
    if (!err.ok()) { return err; }
    err = FetchAll(q, &out->result_set);
    if (!err.ok()) { return err; }

    out->has_result_set = true;
    spdlog::debug("orchestrator: query returned {} row(s)",
                  out->result_set.size());
    return Error::Ok();
  }

  Error DoStatement(const std::string& sql, const TransactionItem& item,
                    ResponseItem* out) {
    Error err;
    Sqlite3Statement stmt = CompileItem(sql, &err);
    if (!err.ok()) { return err; }

    if (item.params_kind() != ParamsKind::kBatch) {
      NamedParams params;
      if (item.params_kind() == ParamsKind::kSingle) {
        err = TranslateParams(item.values(), &params);
        if (!err.ok()) { return err; }
      }
      err = stmt.Bind(params);
      if (!err.ok()) { return err; }
      int64_t changes = stmt.ExecDml(&err);
      if (!err.ok()) { return err; }
      out->has_rows_updated = true;
      out->rows_updated = changes;
      return Error::Ok();
    }

    // One compiled statement, one execution per parameter object.
    std::vector<int64_t> counts;
    counts.reserve(item.values_batch().size());
    for (const Json& values : item.values_batch()) {
      NamedParams params;
      err = TranslateParams(values, &params);
      if (!err.ok()) { return err; }
      err = stmt.ClearBindings();
      if (!err.ok()) { return err; }
      err = stmt.Bind(params);
      if (!err.ok()) { return err; }
      int64_t changes = stmt.ExecDml(&err);
      if (!err.ok()) { return err; }
      counts.push_back(changes);
    }
    out->has_rows_updated_batch = true;
    out->rows_updated_batch = std::move(counts);
    return Error::Ok();
  }

  Sqlite3Db& db_;
  const DbConfig& config_;
};

}  // namespace sqlgw
