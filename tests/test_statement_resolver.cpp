// Copyright (c) 2024 liudegui. MIT License.
// Tests for sqlgw::StatementRegistry and ResolveSql().

#include <catch2/catch_test_macros.hpp>
#include <cstring>

#include "sqlgw/statement_resolver.hpp"

using namespace sqlgw;

static StatementRegistry MakeRegistry() {
  std::map<std::string, std::string> m;
  m["Q1"] = "SELECT * FROM t;";
  m["INS"] = "INSERT INTO t VALUES(:v);";
  return StatementRegistry(std::move(m));
}

TEST_CASE("StatementRegistry: lookup", "[statement_resolver]") {
  StatementRegistry reg = MakeRegistry();
  REQUIRE(reg.Size() == 2);
  REQUIRE_FALSE(reg.Empty());
  REQUIRE(reg.Find("Q1") != nullptr);
  REQUIRE(*reg.Find("Q1") == "SELECT * FROM t;");
  REQUIRE(reg.Find("q1") == nullptr);
  REQUIRE(reg.Find("missing") == nullptr);
  REQUIRE(StatementRegistry().Empty());
}

TEST_CASE("ResolveSql: plain name resolves to stored SQL",
          "[statement_resolver]") {
  StatementRegistry reg = MakeRegistry();
  std::string text = "Q1";
  const std::string* sql = nullptr;
  REQUIRE(ResolveSql(text, reg, false, &sql).ok());
  REQUIRE(*sql == "SELECT * FROM t;");
}

TEST_CASE("ResolveSql: marker resolves to stored SQL",
          "[statement_resolver]") {
  StatementRegistry reg = MakeRegistry();
  std::string text = "^INS";
  const std::string* sql = nullptr;
  REQUIRE(ResolveSql(text, reg, true, &sql).ok());
  REQUIRE(*sql == "INSERT INTO t VALUES(:v);");
}

TEST_CASE("ResolveSql: unknown marker is a resolution error",
          "[statement_resolver]") {
  StatementRegistry reg = MakeRegistry();
  std::string text = "^NOPE";
  const std::string* sql = &text;
  Error err = ResolveSql(text, reg, false, &sql);
  REQUIRE(err.code == ErrorCode::kResolution);
  REQUIRE(std::strstr(err.message, "NOPE") != nullptr);
  REQUIRE(sql == nullptr);
}

TEST_CASE("ResolveSql: literal SQL passes through", "[statement_resolver]") {
  StatementRegistry reg = MakeRegistry();
  std::string text = "SELECT 1;";
  const std::string* sql = nullptr;
  REQUIRE(ResolveSql(text, reg, false, &sql).ok());
  REQUIRE(sql == &text);
}

TEST_CASE("ResolveSql: stored-only rejects literal SQL",
          "[statement_resolver]") {
  StatementRegistry reg = MakeRegistry();
  std::string text = "DELETE FROM t;";
  const std::string* sql = nullptr;
  Error err = ResolveSql(text, reg, true, &sql);
  REQUIRE(err.code == ErrorCode::kResolution);
  REQUIRE(err.kind() == ErrorKind::kResolution);
  REQUIRE(sql == nullptr);
}

TEST_CASE("ResolveSql: empty registry", "[statement_resolver]") {
  StatementRegistry reg;
  std::string text = "Q1";
  const std::string* sql = nullptr;
  REQUIRE(ResolveSql(text, reg, false, &sql).ok());
  REQUIRE(sql == &text);
  REQUIRE(ResolveSql(text, reg, true, &sql).code == ErrorCode::kResolution);
}
