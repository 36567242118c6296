// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlgw::ConnectionRegistry and ConnectionLease.

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

#include "sqlgw/connection_registry.hpp"

using namespace sqlgw;

TEST_CASE("ConnectionRegistry: add and acquire", "[connection_registry]") {
  ConnectionRegistry registry;
  REQUIRE(registry.Add("main", ":memory:", DbConfig{}).ok());
  REQUIRE(registry.Contains("main"));
  REQUIRE_FALSE(registry.Contains("other"));

  Error err;
  ConnectionLease lease = registry.Acquire("main", &err);
  REQUIRE(err.ok());
  REQUIRE(lease.Valid());
  REQUIRE(lease.Db().IsOpen());
  REQUIRE_FALSE(lease.Config().read_only);

  lease.Release();
  REQUIRE_FALSE(lease.Valid());
}

TEST_CASE("ConnectionRegistry: unknown database", "[connection_registry]") {
  ConnectionRegistry registry;
  Error err;
  ConnectionLease lease = registry.Acquire("nope", &err);
  REQUIRE_FALSE(lease.Valid());
  REQUIRE(err.code == ErrorCode::kNotFound);
  REQUIRE(std::strstr(err.message, "nope") != nullptr);
}

TEST_CASE("ConnectionRegistry: duplicate name", "[connection_registry]") {
  ConnectionRegistry registry;
  REQUIRE(registry.Add("main", ":memory:", DbConfig{}).ok());
  REQUIRE(registry.Add("main", ":memory:", DbConfig{}).code ==
          ErrorCode::kMisuse);
}

TEST_CASE("ConnectionRegistry: init statements on a new database",
          "[connection_registry]") {
  DbConfig cfg;
  cfg.init_statements.push_back("CREATE TABLE t(v INTEGER);");
  cfg.init_statements.push_back("INSERT INTO t VALUES(1);");

  ConnectionRegistry registry;
  REQUIRE(registry.Add("main", ":memory:", cfg).ok());
  ConnectionLease lease = registry.Acquire("main");
  REQUIRE(lease.Db().ExecScalar("SELECT count(*) FROM t;") == 1);
}

TEST_CASE("ConnectionRegistry: init statements skip existing files",
          "[connection_registry]") {
  const char* path = "sqlgw_test_registry.db";
  std::remove(path);

  DbConfig cfg;
  cfg.init_statements.push_back("CREATE TABLE t(v INTEGER);");
  cfg.init_statements.push_back("INSERT INTO t VALUES(1);");
  {
    ConnectionRegistry first;
    REQUIRE(first.Add("main", path, cfg).ok());
  }
  {
    // Would fail on CREATE TABLE if run a second time.
    ConnectionRegistry second;
    REQUIRE(second.Add("main", path, cfg).ok());
    ConnectionLease lease = second.Acquire("main");
    REQUIRE(lease.Db().ExecScalar("SELECT count(*) FROM t;") == 1);
  }
  std::remove(path);
}

TEST_CASE("ConnectionRegistry: init statements skip existing URI databases",
          "[connection_registry]") {
  const char* file = "sqlgw_test_registry_uri.db";
  const char* uri = "file:sqlgw_test_registry_uri.db?mode=rwc";
  std::remove(file);

  DbConfig cfg;
  cfg.init_statements.push_back("CREATE TABLE t(v INTEGER);");
  cfg.init_statements.push_back("INSERT INTO t VALUES(1);");
  {
    ConnectionRegistry first;
    REQUIRE(first.Add("main", uri, cfg).ok());
  }
  {
    ConnectionRegistry second;
    REQUIRE(second.Add("main", uri, cfg).ok());
    ConnectionLease lease = second.Acquire("main");
    REQUIRE(lease.Db().ExecScalar("SELECT count(*) FROM t;") == 1);
  }
  std::remove(file);
}

TEST_CASE("ConnectionRegistry: concurrent Add of one name initializes once",
          "[connection_registry]") {
  const char* path = "sqlgw_test_registry_race.db";
  std::remove(path);

  DbConfig cfg;
  cfg.busy_timeout_ms = 1000;
  cfg.init_statements.push_back("CREATE TABLE t(v INTEGER);");
  cfg.init_statements.push_back("INSERT INTO t VALUES(1);");

  ConnectionRegistry registry;
  std::atomic<int> added(0);
  std::atomic<int> rejected(0);
  auto add = [&registry, &cfg, &added, &rejected, path]() {
    Error err = registry.Add("main", path, cfg);
    if (err.ok()) {
      ++added;
    } else if (err.code == ErrorCode::kMisuse) {
      ++rejected;
    }
  };
  std::thread a(add);
  std::thread b(add);
  a.join();
  b.join();

  REQUIRE(added.load() == 1);
  REQUIRE(rejected.load() == 1);
  {
    ConnectionLease lease = registry.Acquire("main");
    REQUIRE(lease.Db().ExecScalar("SELECT count(*) FROM t;") == 1);
  }
  std::remove(path);
}

TEST_CASE("ConnectionRegistry: failing init statement fails Add",
          "[connection_registry]") {
  DbConfig cfg;
  cfg.init_statements.push_back("CREATE TABLE t(v INTEGER);");
  cfg.init_statements.push_back("INSERT INTO missing VALUES(1);");

  ConnectionRegistry registry;
  REQUIRE_FALSE(registry.Add("main", ":memory:", cfg).ok());
  REQUIRE_FALSE(registry.Contains("main"));
}

TEST_CASE("ConnectionRegistry: journal mode", "[connection_registry]") {
  ConnectionRegistry registry;

  DbConfig good;
  good.journal_mode = "MEMORY";
  good.busy_timeout_ms = 100;
  REQUIRE(registry.Add("good", ":memory:", good).ok());

  DbConfig bad;
  bad.journal_mode = "WAL; DROP TABLE t";
  REQUIRE(registry.Add("bad", ":memory:", bad).code == ErrorCode::kParse);
  REQUIRE_FALSE(registry.Contains("bad"));
}

TEST_CASE("ConnectionRegistry: read-only database must exist",
          "[connection_registry]") {
  DbConfig cfg;
  cfg.read_only = true;
  ConnectionRegistry registry;
  REQUIRE_FALSE(
      registry.Add("ro", "/nonexistent-dir/sqlgw-ro.db", cfg).ok());
}

TEST_CASE("ConnectionRegistry: leases on one database are exclusive",
          "[connection_registry]") {
  ConnectionRegistry registry;
  REQUIRE(registry.Add("main", ":memory:", DbConfig{}).ok());

  ConnectionLease held = registry.Acquire("main");
  REQUIRE(held.Valid());

  std::atomic<bool> acquired(false);
  std::thread other([&registry, &acquired]() {
    ConnectionLease lease = registry.Acquire("main");
    acquired = lease.Valid();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(acquired.load());

  held.Release();
  other.join();
  REQUIRE(acquired.load());
}

TEST_CASE("ConnectionRegistry: different databases do not contend",
          "[connection_registry]") {
  ConnectionRegistry registry;
  REQUIRE(registry.Add("a", ":memory:", DbConfig{}).ok());
  REQUIRE(registry.Add("b", ":memory:", DbConfig{}).ok());

  ConnectionLease a = registry.Acquire("a");
  ConnectionLease b = registry.Acquire("b");
  REQUIRE(a.Valid());
  REQUIRE(b.Valid());
  REQUIRE(&a.Db() != &b.Db());
}

TEST_CASE("ConnectionLease: move transfers the hold", "[connection_registry]") {
  ConnectionRegistry registry;
  REQUIRE(registry.Add("main", ":memory:", DbConfig{}).ok());

  ConnectionLease first = registry.Acquire("main");
  ConnectionLease second = std::move(first);
  REQUIRE(second.Valid());
  REQUIRE_FALSE(first.Valid());
}
