// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::HandleRequest -- single-endpoint gateway entry point.
//
// Usage:
//   #include "sqlgw/gateway.hpp"
//   sqlgw::ConnectionRegistry registry;
//   registry.Add("main", "main.db", sqlgw::DbConfig{});
//   sqlgw::Response resp = sqlgw::HandleRequest(registry, "main", body);
//   send(resp.status, resp.Dump());
//
// The body is parsed before the connection is acquired; the connection
// is held from Acquire() until the orchestrator has committed or rolled
// back.

#pragma once

#include <string>

#include <spdlog/spdlog.h>

#include "sqlgw/connection_registry.hpp"
#include "sqlgw/error.hpp"
#include "sqlgw/orchestrator.hpp"
#include "sqlgw/request.hpp"
#include "sqlgw/response.hpp"

namespace sqlgw {

inline Response HandleRequest(ConnectionRegistry& registry,
                              const std::string& db_name,
                              const std::string& body,
                              const Credentials* transport_credentials =
                                  nullptr) {
  Request request;
  Error err = Request::ParseBody(body, &request);
  if (!err.ok()) {
    spdlog::debug("gateway: rejected body for '{}': {}", db_name,
                  err.message);
    return Response::Fail(kStatusBadRequest, kNoItemIndex, err.message,
                          err.kind());
  }

  ConnectionLease lease = registry.Acquire(db_name, &err);
  if (!lease.Valid()) {
    return Response::Fail(kStatusNotFound, kNoItemIndex, err.message,
                          ErrorKind::kValidation);
  }

  spdlog::debug("gateway: '{}' running {} item(s)", db_name,
                request.transaction.size());
  Orchestrator orchestrator(lease.Db(), lease.Config());
  return orchestrator.Run(request, transport_credentials);
}

}  // namespace sqlgw
