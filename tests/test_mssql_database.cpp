// Copyright (c) 2026 The unidb Authors. MIT License.
// Tests for unidb::Database on MSSQL via FreeTDS (requires a running server).
//
// Environment variables:
//   UNIDB_MSSQL_DSN  -- "host:port:user:password:database", tests skip if unset

#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

#include "unidb/db.hpp"

#if defined(UNIDB_HAS_FREETDS) && UNIDB_HAS_FREETDS
#include "unidb/mssql_backend.hpp"
#endif

using namespace unidb;

static Database OpenTestDb() {
  const char* dsn = std::getenv("UNIDB_MSSQL_DSN");
  if (dsn == nullptr) { SKIP("UNIDB_MSSQL_DSN not set"); }

  Database db;
  auto err = db.Open("mssql", dsn);
  REQUIRE(err.ok());
  db.Query("IF OBJECT_ID('unidb_emp') IS NOT NULL DROP TABLE unidb_emp;"
           "CREATE TABLE unidb_emp (emp_id INT IDENTITY(1,1) PRIMARY KEY, "
           "name VARCHAR(64), active BIT)",
           &err);
  REQUIRE(err.ok());
  return db;
}

TEST_CASE("MssqlDatabase: open and close", "[mssql_database]") {
  auto db = OpenTestDb();
  REQUIRE(db.IsOpen());
  REQUIRE(db.GetBackend() == BackendKind::kMssql);
  db.Close();
  REQUIRE_FALSE(db.IsOpen());
}

TEST_CASE("MssqlDatabase: identity and affected rows", "[mssql_database]") {
  auto db = OpenTestDb();
  Error err;
  auto results = db.TranslatedQuery(
      "INSERT INTO unidb_emp (name, active) VALUES ('Alice', TRUE);"
      "INSERT INTO unidb_emp (name, active) VALUES ('Bob', FALSE);"
      "UPDATE unidb_emp SET active = TRUE",
      &err);
  REQUIRE(err.ok());
  REQUIRE(results[0].GeneratedId() == 1);
  REQUIRE(results[1].GeneratedId() == 2);
  REQUIRE(results[2].AffectedRows() == 2);

  results = db.TranslatedQuery(
      "SELECT LENGTH(name) AS len FROM unidb_emp ORDER BY emp_id", &err);
  REQUIRE(err.ok());
  REQUIRE(results[0].GetInt("len") == 5);
  REQUIRE(results[0].AffectedRows() == 0);
}

TEST_CASE("MssqlDatabase: SQL error", "[mssql_database]") {
  auto db = OpenTestDb();
  Error err;
  db.Query("SELECT * FROM unidb_no_such_table", &err);
  REQUIRE(err.IsSql());
  REQUIRE(std::strstr(err.message, "MSSQL") != nullptr);
}

TEST_CASE("MssqlDatabase: escaping", "[mssql_database]") {
  auto db = OpenTestDb();
  Error err;
  REQUIRE(db.EscapeString("O'Brien", &err) == "'O''Brien'");
  REQUIRE(db.EscapeBlob(std::string("\x01\xab", 2), &err) == "0x01ab");
  REQUIRE(db.EscapeBoolean(true) == "'1'");
}

#if defined(UNIDB_HAS_FREETDS) && UNIDB_HAS_FREETDS
TEST_CASE("MssqlBackend: conversion buffer covers the column", "[mssql]") {
  REQUIRE(mssql_detail::ConvertBufferSize(65536) > 2 * 65536);
  REQUIRE(mssql_detail::ConvertBufferSize(0) >= 64);
  REQUIRE(mssql_detail::ConvertBufferSize(-1) >= 64);
}
#endif

TEST_CASE("MssqlDatabase: long text column", "[mssql_database]") {
  auto db = OpenTestDb();
  Error err;
  auto results = db.Query(
      "SELECT REPLICATE(CAST(N'x' AS NVARCHAR(MAX)), 1000) AS s, "
      "NEWID() AS g",
      &err);
  REQUIRE(err.ok());
  REQUIRE(std::strlen(results[0].GetString("s")) == 1000);
  REQUIRE(std::strlen(results[0].GetString("g")) == 36);
}
