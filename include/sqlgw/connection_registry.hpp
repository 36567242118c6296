// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw::ConnectionRegistry -- one guarded connection per database name.
//
// Design:
//   - Owns every connection and its DbConfig; passed explicitly to the
//     request entry point, no global state
//   - Acquire() blocks until the database's connection is free and
//     returns a ConnectionLease that holds it exclusively until the
//     lease is destroyed
//   - Requests on different databases never contend; requests on the
//     same database serialize
//   - Databases are registered up front; a registered entry never moves,
//     so a lease stays valid while later databases are added
//   - A name is reserved for the whole of Add(), so two concurrent Add()
//     calls for one name never both open and initialize a database

#pragma once

#include <cctype>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "sqlgw/db_config.hpp"
#include "sqlgw/error.hpp"
#include "sqlgw/sqlite3_db.hpp"
#include "sqlgw/transaction.hpp"

namespace sqlgw {

class ConnectionRegistry;

// ---------------------------------------------------------------------------
// ConnectionLease
// ---------------------------------------------------------------------------

class ConnectionLease {
 public:
  ConnectionLease() = default;

  ConnectionLease(ConnectionLease&&) = default;
  ConnectionLease& operator=(ConnectionLease&&) = default;

  ConnectionLease(const ConnectionLease&) = delete;
  ConnectionLease& operator=(const ConnectionLease&) = delete;

  bool Valid() const { return db_ != nullptr && lock_.owns_lock(); }

  Sqlite3Db& Db() const { return *db_; }
  const DbConfig& Config() const { return *config_; }

  /// Give the connection back before the lease goes out of scope.
  void Release() {
    if (lock_.owns_lock()) { lock_.unlock(); }
    db_ = nullptr;
    config_ = nullptr;
  }

 private:
  friend class ConnectionRegistry;

  ConnectionLease(std::unique_lock<std::mutex> lock, Sqlite3Db* db,
                  const DbConfig* config)
      : lock_(std::move(lock)), db_(db), config_(config) {}

  std::unique_lock<std::mutex> lock_;
  Sqlite3Db* db_ = nullptr;
  const DbConfig* config_ = nullptr;
};

// ---------------------------------------------------------------------------
// ConnectionRegistry
// ---------------------------------------------------------------------------

class ConnectionRegistry {
 public:
  ConnectionRegistry() = default;

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  /// Open `path` (a file name or a `file:` URI) and register it under
  /// `name`. Applies the configured busy timeout and journal mode, and
  /// runs the init statements when the database holds no pages yet.
  Error Add(const std::string& name, const char* path, DbConfig config) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    {
      std::lock_guard<std::mutex> guard(mutex_);
      if (entries_.count(name) != 0 || pending_.count(name) != 0) {
        Error err;
        err.SetFormat(ErrorCode::kMisuse, "Database '%s' already registered",
                      name.c_str());
        return err;
      }
      pending_.insert(name);
    }

    std::unique_ptr<Entry> entry(new Entry());
    entry->config = std::move(config);
    Error err = OpenEntry(path, entry.get());

    std::lock_guard<std::mutex> guard(mutex_);
    pending_.erase(name);
    if (!err.ok()) { return err; }
    entries_.emplace(name, std::move(entry));
    spdlog::info("registry: database '{}' registered ({})", name, path);
    return Error::Ok();
  }

  bool Contains(const std::string& name) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.count(name) != 0;
  }

  /// Exclusive hold on the connection for `name`; blocks while another
  /// lease on the same database is alive. Unknown names yield kNotFound
  /// and an invalid lease.
  ConnectionLease Acquire(const std::string& name,
                          Error* out_error = nullptr) {
    Entry* entry = nullptr;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      auto it = entries_.find(name);
      if (it != entries_.end()) { entry = it->second.get(); }
    }
    if (entry == nullptr) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kNotFound, "Unknown database '%s'",
                             name.c_str());
      }
      return ConnectionLease{};
    }
    std::unique_lock<std::mutex> lock(entry->mutex);
    return ConnectionLease(std::move(lock), &entry->db, &entry->config);
  }

 private:
  struct Entry {
    std::mutex mutex;
    Sqlite3Db db;
    DbConfig config;
  };

  static Error OpenEntry(const char* path, Entry* entry) {
    Error err = entry->db.Open(path, entry->config.read_only);
    if (!err.ok()) { return err; }

    // A new file, an empty file and an in-memory database all start with
    // zero pages, whatever form the path took.
    int64_t pages = entry->db.ExecScalar("PRAGMA page_count;", 0, &err);
    if (!err.ok()) { return err; }

    if (entry->config.busy_timeout_ms > 0) {
      entry->db.SetBusyTimeout(entry->config.busy_timeout_ms);
    }
    if (!entry->config.journal_mode.empty()) {
      err = SetJournalMode(entry->db, entry->config.journal_mode);
      if (!err.ok()) { return err; }
    }
    if (pages == 0 && !entry->config.read_only &&
        !entry->config.init_statements.empty()) {
      err = RunInitStatements(entry->db, entry->config);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  static Error SetJournalMode(Sqlite3Db& db, const std::string& mode) {
    for (char c : mode) {
      if (!std::isalpha(static_cast<unsigned char>(c))) {
        Error err;
        err.SetFormat(ErrorCode::kParse, "Invalid journal mode '%s'",
                      mode.c_str());
        return err;
      }
    }
    std::string sql = "PRAGMA journal_mode = " + mode + ";";
    Error err;
    db.ExecDml(sql.c_str(), &err);
    return err;
  }

  static Error RunInitStatements(Sqlite3Db& db, const DbConfig& config) {
    Transaction txn(db);
    Error err = txn.Begin();
    if (!err.ok()) { return err; }
    for (const std::string& sql : config.init_statements) {
      db.ExecDml(sql.c_str(), &err);
      if (!err.ok()) {
        spdlog::error("registry: init statement failed: {}", err.message);
        return err;
      }
    }
    return txn.Commit();
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<Entry>> entries_;
  std::set<std::string> pending_;
};

}  // namespace sqlgw
