// Copyright (c) 2026 The unidb Authors. MIT License.
// Tests for unidb::Database on PostgreSQL (requires a running server).
//
// Environment variables:
//   UNIDB_PG_DSN  -- "host:port:user:password:database", tests skip if unset

#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

#include "unidb/db.hpp"

using namespace unidb;

static Database OpenTestDb() {
  const char* dsn = std::getenv("UNIDB_PG_DSN");
  if (dsn == nullptr) { SKIP("UNIDB_PG_DSN not set"); }

  Database db;
  auto err = db.Open("postgresql", dsn);
  REQUIRE(err.ok());
  db.Query("DROP TABLE IF EXISTS unidb_emp;"
           "CREATE TABLE unidb_emp (emp_id SERIAL PRIMARY KEY, "
           "name VARCHAR(64), active BOOLEAN, photo BYTEA)",
           &err);
  REQUIRE(err.ok());
  return db;
}

TEST_CASE("PgDatabase: open and close", "[pg_database]") {
  auto db = OpenTestDb();
  REQUIRE(db.IsOpen());
  REQUIRE(db.GetFamily() == Family::kPostgresql);
  REQUIRE((db.GetBackend() == BackendKind::kPgsql ||
           db.GetBackend() == BackendKind::kOdbc));
  db.Close();
  REQUIRE_FALSE(db.IsOpen());
}

TEST_CASE("PgDatabase: insert ids and affected rows", "[pg_database]") {
  auto db = OpenTestDb();
  Error err;
  auto results = db.Query(
      "INSERT INTO unidb_emp (name) VALUES ('Alice');"
      "INSERT INTO unidb_emp (name) VALUES ('Bob');"
      "UPDATE unidb_emp SET active = TRUE",
      &err);
  REQUIRE(err.ok());
  REQUIRE(results.size() == 3);
  REQUIRE(results[0].GeneratedId() + 1 == results[1].GeneratedId());
  REQUIRE(results[2].AffectedRows() == 2);
  REQUIRE_FALSE(results[2].HasGeneratedId());

  results = db.Query("SELECT name FROM unidb_emp ORDER BY emp_id", &err);
  REQUIRE(results[0].ReturnedRows() == 2);
  REQUIRE(results[0].AffectedRows() == 0);
}

TEST_CASE("PgDatabase: id lookup inside a transaction", "[pg_database]") {
  auto db = OpenTestDb();
  Error err;
  auto results = db.Query(
      "BEGIN;"
      "CREATE TEMP TABLE unidb_plain (v INTEGER);"
      "INSERT INTO unidb_plain VALUES (1);"
      "SELECT COUNT(*) AS n FROM unidb_plain;"
      "COMMIT",
      &err);
  // A failed id lookup must not abort the surrounding transaction
  REQUIRE(err.ok());
  REQUIRE(results.size() == 5);
  REQUIRE(results[3].GetInt("n") == 1);
}

TEST_CASE("PgDatabase: SQL error", "[pg_database]") {
  auto db = OpenTestDb();
  Error err;
  db.Query("SELECT * FROM unidb_no_such_table", &err);
  REQUIRE(err.IsSql());
  REQUIRE(std::strstr(err.message, "PostgreSQL") != nullptr);
  REQUIRE(std::strstr(err.message, "unidb_no_such_table") != nullptr);
}

TEST_CASE("PgDatabase: escaping round trip", "[pg_database]") {
  auto db = OpenTestDb();
  Error err;
  std::string blob("\x00\x01\xfe\xff", 4);
  db.Query("INSERT INTO unidb_emp (name, active, photo) VALUES (" +
               db.EscapeString("O'Brien", &err) + ", " +
               db.EscapeBoolean(false) + ", " + db.EscapeBlob(blob, &err) +
               ")",
           &err);
  REQUIRE(err.ok());

  auto results = db.Query("SELECT name, active, photo FROM unidb_emp", &err);
  REQUIRE(err.ok());
  const Result& r = results[0];
  REQUIRE(std::strcmp(r.GetString("name"), "O'Brien") == 0);
  REQUIRE_FALSE(db.UnescapeBoolean(r.GetString("active")));
  REQUIRE(db.UnescapeBlob(r.GetBlob(2), &err) == blob);
}
