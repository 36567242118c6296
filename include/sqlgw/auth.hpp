// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw auth gate -- credential checks before any transaction opens.
//
// Design:
//   - CredentialVerifier is the (user, password) -> bool capability
//   - Two verifiers ship: a fixed credential list, and a query run on the
//     database's own connection (authorized iff it yields a row)
//   - AuthMode picks where credentials come from: the request body
//     (INLINE) or the transport (HTTP_BASIC)
//   - Missing credentials never authorize

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "sqlgw/error.hpp"
#include "sqlgw/request.hpp"
#include "sqlgw/sqlite3_db.hpp"

namespace sqlgw {

enum class AuthMode : int32_t {
  kInline = 0,
  kHttpBasic,
};

// ---------------------------------------------------------------------------
// CredentialVerifier
// ---------------------------------------------------------------------------

class CredentialVerifier {
 public:
  virtual ~CredentialVerifier() = default;
  virtual bool Verify(const std::string& user,
                      const std::string& password) = 0;
};

class CredentialListVerifier : public CredentialVerifier {
 public:
  explicit CredentialListVerifier(std::vector<Credentials> allowed)
      : allowed_(std::move(allowed)) {}

  bool Verify(const std::string& user,
              const std::string& password) override {
    for (const Credentials& c : allowed_) {
      if (c.user == user && c.password == password) { return true; }
    }
    return false;
  }

 private:
  std::vector<Credentials> allowed_;
};

/// Runs `sql` with :user and :password bound (whichever it declares).
class QueryCredentialVerifier : public CredentialVerifier {
 public:
  QueryCredentialVerifier(Sqlite3Db& db, std::string sql)
      : db_(db), sql_(std::move(sql)) {}

  bool Verify(const std::string& user,
              const std::string& password) override {
    Error err;
    Sqlite3Statement stmt = db_.CompileStatement(sql_.c_str(), &err);
    if (!err.ok()) {
      spdlog::warn("auth: query does not compile: {}", err.message);
      return false;
    }
    int32_t idx = stmt.ParamIndex(":user");
    if (idx > 0) { err = stmt.Bind(idx, user); }
    idx = stmt.ParamIndex(":password");
    if (err.ok() && idx > 0) { err = stmt.Bind(idx, password); }
    if (!err.ok()) {
      spdlog::warn("auth: binding credentials failed: {}", err.message);
      return false;
    }
    Sqlite3Query q = stmt.ExecQuery(&err);
    if (!err.ok()) {
      spdlog::warn("auth: query failed: {}", err.message);
      return false;
    }
    return !q.Eof();
  }

 private:
  Sqlite3Db& db_;
  std::string sql_;
};

// ---------------------------------------------------------------------------
// AuthConfig
// ---------------------------------------------------------------------------

struct AuthConfig {
  AuthMode mode = AuthMode::kInline;
  std::string by_query;
  std::vector<Credentials> by_credentials;
  /// Installed by the embedding application; takes precedence.
  std::shared_ptr<CredentialVerifier> verifier;
};

// ---------------------------------------------------------------------------
// Authorize
// ---------------------------------------------------------------------------

/// Check the credentials AuthConfig says to use. `inline_credentials` comes
/// from the request body, `transport_credentials` from the transport; either
/// may be null.
inline Error Authorize(const AuthConfig& auth, Sqlite3Db& db,
                       const Credentials* inline_credentials,
                       const Credentials* transport_credentials) {
  const Credentials* creds = auth.mode == AuthMode::kInline
                                 ? inline_credentials
                                 : transport_credentials;
  if (creds == nullptr) {
    spdlog::warn("auth: no credentials supplied");
    return Error::Make(ErrorCode::kAuth, "Authorization failed");
  }

  bool ok = false;
  if (auth.verifier) {
    ok = auth.verifier->Verify(creds->user, creds->password);
  } else if (!auth.by_query.empty()) {
    QueryCredentialVerifier verifier(db, auth.by_query);
    ok = verifier.Verify(creds->user, creds->password);
  } else {
    CredentialListVerifier verifier(auth.by_credentials);
    ok = verifier.Verify(creds->user, creds->password);
  }

  if (!ok) {
    spdlog::warn("auth: credentials rejected for user '{}'", creds->user);
    return Error::Make(ErrorCode::kAuth, "Authorization failed");
  }
  return Error::Ok();
}

}  // namespace sqlgw
