// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::DbConfig -- per-database gateway configuration.
//
// JSON form (every key optional, unknown keys ignored):
//   {
//     "auth": {"mode": "INLINE" | "HTTP_BASIC",
//              "byQuery": "SELECT 1 FROM users WHERE ...:user...:password",
//              "byCredentials": [{"user": "u", "password": "p"}]},
//     "readOnly": false,
//     "useOnlyStoredStatements": false,
//     "storedStatements": [{"id": "Q1", "sql": "SELECT ..."}],
//     "initStatements": ["CREATE TABLE ..."],
//     "journalMode": "WAL",
//     "busyTimeoutMs": 1000
//   }
// "auth" takes exactly one of "byQuery" and "byCredentials".

#pragma once

#include <cstdint>
#include <cstdio>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "sqlgw/auth.hpp"
#include "sqlgw/error.hpp"
#include "sqlgw/json.hpp"
#include "sqlgw/statement_resolver.hpp"

namespace sqlgw {

// ---------------------------------------------------------------------------
// DbConfig
// ---------------------------------------------------------------------------

struct DbConfig {
  bool has_auth = false;
  AuthConfig auth;

  bool read_only = false;
  bool use_only_stored_statements = false;
  StatementRegistry stored_statements;

  /// Run once, in one transaction, when the database file is created.
  std::vector<std::string> init_statements;

  std::string journal_mode;     // empty: engine default
  int32_t busy_timeout_ms = 0;  // 0: no busy handler
};

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

namespace detail {

inline Error ConfigError(const char* key, const char* what) {
  Error err;
  err.SetFormat(ErrorCode::kParse, "Config '%s': %s", key, what);
  return err;
}

inline Error ParseAuth(const Json& json, AuthConfig* out) {
  if (!json.is_object()) { return ConfigError("auth", "must be an object"); }

  auto mode = json.find("mode");
  if (mode != json.end()) {
    std::string m = mode->is_string() ? mode->get<std::string>() : "";
    if (m == "INLINE") {
      out->mode = AuthMode::kInline;
    } else if (m == "HTTP_BASIC") {
      out->mode = AuthMode::kHttpBasic;
    } else {
      return ConfigError("auth.mode", "must be \"INLINE\" or \"HTTP_BASIC\"");
    }
  }

  auto by_query = json.find("byQuery");
  auto by_credentials = json.find("byCredentials");
  if ((by_query == json.end()) == (by_credentials == json.end())) {
    return ConfigError("auth",
                       "exactly one of byQuery and byCredentials is required");
  }

  if (by_query != json.end()) {
    if (!by_query->is_string() || by_query->get<std::string>().empty()) {
      return ConfigError("auth.byQuery", "must be a non-empty string");
    }
    out->by_query = by_query->get<std::string>();
    return Error::Ok();
  }

  if (!by_credentials->is_array()) {
    return ConfigError("auth.byCredentials", "must be an array");
  }
  for (const Json& c : *by_credentials) {
    auto user = c.is_object() ? c.find("user") : c.end();
    auto password = c.is_object() ? c.find("password") : c.end();
    if (!c.is_object() || user == c.end() || password == c.end() ||
        !user->is_string() || !password->is_string()) {
      return ConfigError("auth.byCredentials",
                         "entries need string 'user' and 'password'");
    }
    out->by_credentials.push_back(
        Credentials{user->get<std::string>(), password->get<std::string>()});
  }
  return Error::Ok();
}

inline Error ParseBool(const Json& json, const char* key, bool* out) {
  auto it = json.find(key);
  if (it == json.end()) { return Error::Ok(); }
  if (!it->is_boolean()) { return ConfigError(key, "must be a boolean"); }
  *out = it->get<bool>();
  return Error::Ok();
}

}  // namespace detail

inline Error ParseDbConfig(const Json& json, DbConfig* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "out is null");
  }
  *out = DbConfig{};
  if (!json.is_object()) {
    return Error::Make(ErrorCode::kParse, "Config must be a JSON object");
  }

  auto auth = json.find("auth");
  if (auth != json.end() && !auth->is_null()) {
    Error err = detail::ParseAuth(*auth, &out->auth);
    if (!err.ok()) { return err; }
    out->has_auth = true;
  }

  Error err = detail::ParseBool(json, "readOnly", &out->read_only);
  if (!err.ok()) { return err; }
  err = detail::ParseBool(json, "useOnlyStoredStatements",
                          &out->use_only_stored_statements);
  if (!err.ok()) { return err; }

  auto stored = json.find("storedStatements");
  if (stored != json.end()) {
    if (!stored->is_array()) {
      return detail::ConfigError("storedStatements", "must be an array");
    }
    std::map<std::string, std::string> statements;
    for (const Json& s : *stored) {
      auto id = s.is_object() ? s.find("id") : s.end();
      auto sql = s.is_object() ? s.find("sql") : s.end();
      if (!s.is_object() || id == s.end() || sql == s.end() ||
          !id->is_string() || !sql->is_string()) {
        return detail::ConfigError("storedStatements",
                                   "entries need string 'id' and 'sql'");
      }
      if (!statements.emplace(id->get<std::string>(), sql->get<std::string>())
               .second) {
        Error dup;
        dup.SetFormat(ErrorCode::kParse,
                      "Config 'storedStatements': duplicate id '%s'",
                      id->get<std::string>().c_str());
        return dup;
      }
    }
    out->stored_statements = StatementRegistry(std::move(statements));
  }

  auto init = json.find("initStatements");
  if (init != json.end()) {
    if (!init->is_array()) {
      return detail::ConfigError("initStatements", "must be an array");
    }
    for (const Json& s : *init) {
      if (!s.is_string()) {
        return detail::ConfigError("initStatements", "entries must be strings");
      }
      out->init_statements.push_back(s.get<std::string>());
    }
  }

  auto journal = json.find("journalMode");
  if (journal != json.end()) {
    if (!journal->is_string()) {
      return detail::ConfigError("journalMode", "must be a string");
    }
    out->journal_mode = journal->get<std::string>();
  }

  auto busy = json.find("busyTimeoutMs");
  if (busy != json.end()) {
    if (!busy->is_number_integer() || busy->get<int64_t>() < 0 ||
        busy->get<int64_t>() > INT32_MAX) {
      return detail::ConfigError("busyTimeoutMs",
                                 "must be a non-negative integer");
    }
    out->busy_timeout_ms = static_cast<int32_t>(busy->get<int64_t>());
  }
  return Error::Ok();
}

/// Read a whole file into *out.
inline Error ReadTextFile(const char* path, std::string* out) {
  if (path == nullptr || out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "path or out is null");
  }
  std::FILE* f = std::fopen(path, "rb");
  if (f == nullptr) {
    Error err;
    err.SetFormat(ErrorCode::kIoError, "Cannot open %s", path);
    return err;
  }
  out->clear();
  char buf[4096];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    out->append(buf, n);
  }
  bool read_failed = std::ferror(f) != 0;
  std::fclose(f);
  if (read_failed) {
    Error err;
    err.SetFormat(ErrorCode::kIoError, "Cannot read %s", path);
    return err;
  }
  return Error::Ok();
}

/// Read and parse a JSON config file.
inline Error LoadDbConfig(const char* path, DbConfig* out) {
  std::string text;
  Error err = ReadTextFile(path, &text);
  if (!err.ok()) { return err; }

  Json json;
  err = ParseJson(text, &json);
  if (!err.ok()) {
    err.SetFormat(ErrorCode::kParse, "Config file %s: malformed JSON", path);
    return err;
  }
  return ParseDbConfig(json, out);
}

}  // namespace sqlgw
