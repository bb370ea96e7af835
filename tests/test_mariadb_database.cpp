// Copyright (c) 2026 The unidb Authors. MIT License.
// Tests for unidb::Database on MySQL/MariaDB (requires a running server).
//
// Environment variables:
//   UNIDB_MYSQL_DSN  -- "host:port:user:password:database", tests skip if unset

#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

#include "unidb/db.hpp"

using namespace unidb;

static Database OpenTestDb() {
  const char* dsn = std::getenv("UNIDB_MYSQL_DSN");
  if (dsn == nullptr) { SKIP("UNIDB_MYSQL_DSN not set"); }

  Database db;
  auto err = db.Open("mysql", dsn);
  REQUIRE(err.ok());
  db.Query("DROP TABLE IF EXISTS unidb_emp;"
           "CREATE TABLE unidb_emp (emp_id INT AUTO_INCREMENT PRIMARY KEY, "
           "name VARCHAR(64), active BOOLEAN, photo BLOB)",
           &err);
  REQUIRE(err.ok());
  return db;
}

TEST_CASE("MariaDatabase: open and close", "[mariadb_database]") {
  auto db = OpenTestDb();
  REQUIRE(db.IsOpen());
  REQUIRE(db.GetFamily() == Family::kMysql);
  db.Close();
  REQUIRE_FALSE(db.IsOpen());
}

TEST_CASE("MariaDatabase: ANSI session mode", "[mariadb_database]") {
  auto db = OpenTestDb();
  Error err;
  auto results = db.Query("SELECT 'a' || 'b' AS joined", &err);
  REQUIRE(err.ok());
  REQUIRE(std::strcmp(results[0].GetString("joined"), "ab") == 0);
}

TEST_CASE("MariaDatabase: insert ids and affected rows",
          "[mariadb_database]") {
  auto db = OpenTestDb();
  Error err;
  auto results = db.Query(
      "INSERT INTO unidb_emp (name) VALUES ('Alice');"
      "INSERT INTO unidb_emp (name) VALUES ('Bob');"
      "DELETE FROM unidb_emp WHERE name = 'Alice'",
      &err);
  REQUIRE(err.ok());
  REQUIRE(results[0].GeneratedId() == 1);
  REQUIRE(results[1].GeneratedId() == 2);
  REQUIRE(results[2].AffectedRows() == 1);

  results = db.Query("SELECT * FROM unidb_emp", &err);
  REQUIRE(results[0].ReturnedRows() == 1);
  REQUIRE(results[0].AffectedRows() == 0);
}

TEST_CASE("MariaDatabase: SQL error", "[mariadb_database]") {
  auto db = OpenTestDb();
  Error err;
  db.Query("SELECT * FROM unidb_no_such_table", &err);
  REQUIRE(err.IsSql());
  REQUIRE(std::strstr(err.message, "MySQL") != nullptr);
}

TEST_CASE("MariaDatabase: escaping round trip", "[mariadb_database]") {
  auto db = OpenTestDb();
  Error err;
  std::string blob("\x00'\\\xff", 4);
  db.Query("INSERT INTO unidb_emp (name, active, photo) VALUES (" +
               db.EscapeString("back\\slash 'quote'", &err) + ", " +
               db.EscapeBoolean(true) + ", " + db.EscapeBlob(blob, &err) +
               ")",
           &err);
  REQUIRE(err.ok());

  auto results = db.Query("SELECT name, active, photo FROM unidb_emp", &err);
  REQUIRE(err.ok());
  const Result& r = results[0];
  REQUIRE(std::strcmp(r.GetString("name"), "back\\slash 'quote'") == 0);
  REQUIRE(db.UnescapeBoolean(r.GetString("active")));
  REQUIRE(r.GetBlob(2) == blob);
}
