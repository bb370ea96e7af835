// Copyright (c) 2026 The unidb Authors. MIT License.
// Tests for unidb::SplitStatements() and IsInsertStatement().

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "unidb/statement_splitter.hpp"

using namespace unidb;

TEST_CASE("SplitStatements: single statement unchanged", "[splitter]") {
  auto out = SplitStatements("SELECT * FROM users ");
  REQUIRE(out.size() == 1);
  REQUIRE(out[0] == "SELECT * FROM users ");
}

TEST_CASE("SplitStatements: multiple statements", "[splitter]") {
  auto out = SplitStatements(
      "INSERT INTO t VALUES (1);  INSERT INTO t VALUES (2);\n"
      "SELECT * FROM t;");
  REQUIRE(out.size() == 3);
  REQUIRE(out[0] == "INSERT INTO t VALUES (1)");
  REQUIRE(out[1] == "INSERT INTO t VALUES (2)");
  REQUIRE(out[2] == "SELECT * FROM t");
}

TEST_CASE("SplitStatements: semicolon inside literal", "[splitter]") {
  auto out = SplitStatements(
      "INSERT INTO t VALUES ('a;b'); INSERT INTO t VALUES ('it''s;')");
  REQUIRE(out.size() == 2);
  REQUIRE(out[0] == "INSERT INTO t VALUES ('a;b')");
  REQUIRE(out[1] == "INSERT INTO t VALUES ('it''s;')");
}

TEST_CASE("SplitStatements: backslash escaped quote", "[splitter]") {
  auto out = SplitStatements("SELECT 'x\\';y'; SELECT 2");
  REQUIRE(out.size() == 2);
  REQUIRE(out[0] == "SELECT 'x\\';y'");
}

TEST_CASE("SplitStatements: blank fragments dropped", "[splitter]") {
  auto out = SplitStatements("SELECT 1;; ;\n;SELECT 2;");
  REQUIRE(out.size() == 2);
  REQUIRE(SplitStatements(" ; ; ").empty());
}

TEST_CASE("SplitStatements: trigger body kept whole", "[splitter]") {
  std::string sql =
      "CREATE TRIGGER audit AFTER INSERT ON t BEGIN "
      "INSERT INTO log VALUES (NEW.id); "
      "UPDATE t SET seen = 1 WHERE id = NEW.id; "
      "END; SELECT 1";
  auto out = SplitStatements(sql);
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].find("UPDATE t SET seen") != std::string::npos);
  REQUIRE(out[0].substr(out[0].size() - 3) == "END");
  REQUIRE(out[1] == "SELECT 1");
}

TEST_CASE("SplitStatements: CASE inside CREATE", "[splitter]") {
  auto out = SplitStatements(
      "CREATE TRIGGER tr BEFORE UPDATE ON t BEGIN "
      "SELECT CASE WHEN NEW.a < 0 THEN RAISE(ABORT, 'neg') END; "
      "END; DELETE FROM t");
  REQUIRE(out.size() == 2);
  REQUIRE(out[1] == "DELETE FROM t");
}

TEST_CASE("SplitStatements: semicolon before bare END", "[splitter]") {
  auto out = SplitStatements("BEGIN SELECT 1; END; SELECT 2");
  REQUIRE(out.size() == 2);
  REQUIRE(out[0] == "BEGIN SELECT 1; END");
}

TEST_CASE("SplitStatements: END prefix of another word", "[splitter]") {
  auto out = SplitStatements("SELECT 1; ENDPOINT");
  REQUIRE(out.size() == 2);
}

TEST_CASE("IsInsertStatement", "[splitter]") {
  REQUIRE(IsInsertStatement("INSERT INTO t VALUES (1)"));
  REQUIRE(IsInsertStatement("  insert into t default values"));
  REQUIRE(IsInsertStatement("REPLACE INTO t VALUES (1)"));
  REQUIRE_FALSE(IsInsertStatement("SELECT 'INSERT'"));
  REQUIRE_FALSE(IsInsertStatement("INSERTED"));
  REQUIRE_FALSE(IsInsertStatement(""));
}

TEST_CASE("SplitStatements: BEGIN as a column name", "[splitter]") {
  auto out = SplitStatements(
      "CREATE TABLE periods (begin TEXT, finish TEXT); "
      "INSERT INTO periods VALUES ('a', 'b')");
  REQUIRE(out.size() == 2);
  REQUIRE(out[1] == "INSERT INTO periods VALUES ('a', 'b')");
}

TEST_CASE("SplitStatements: CASE in CREATE TABLE AS", "[splitter]") {
  auto out = SplitStatements(
      "CREATE TABLE flags AS SELECT CASE WHEN x THEN 1 END AS f FROM t; "
      "SELECT 1");
  REQUIRE(out.size() == 2);
}

TEST_CASE("SplitStatements: qualified and parenthesized keywords",
          "[splitter]") {
  auto out = SplitStatements(
      "CREATE PROCEDURE p(begin INT) BEGIN SELECT NEW.begin; END; SELECT 2");
  REQUIRE(out.size() == 2);
  REQUIRE(out[1] == "SELECT 2");
}

TEST_CASE("SplitStatements: END IF closes only the IF", "[splitter]") {
  auto out = SplitStatements(
      "CREATE PROCEDURE p() BEGIN IF 1 THEN SELECT 1; END IF; SELECT 2; END; "
      "SELECT 3");
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].find("SELECT 2; END") != std::string::npos);
  REQUIRE(out[1] == "SELECT 3");
}

TEST_CASE("SplitStatements: loops and CASE statements in a body",
          "[splitter]") {
  auto out = SplitStatements(
      "CREATE PROCEDURE p() BEGIN "
      "WHILE i < 3 DO SET i = i + 1; END WHILE; "
      "l: LOOP LEAVE l; END LOOP; "
      "REPEAT SET i = i - 1; UNTIL i = 0 END REPEAT; "
      "CASE i WHEN 0 THEN SELECT 0; ELSE SELECT 1; END CASE; "
      "END; SELECT 4");
  REQUIRE(out.size() == 2);
  REQUIRE(out[1] == "SELECT 4");
}

TEST_CASE("SplitStatements: dollar-quoted function body", "[splitter]") {
  auto out = SplitStatements(
      "CREATE FUNCTION f() RETURNS int AS $$ BEGIN RETURN 1; END; $$ "
      "LANGUAGE plpgsql; SELECT f()");
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].substr(out[0].size() - 16) == "LANGUAGE plpgsql");

  out = SplitStatements("DO $body$ BEGIN PERFORM 1; END $body$; SELECT 1");
  REQUIRE(out.size() == 2);
}

TEST_CASE("SplitStatements: comments and quoted names", "[splitter]") {
  auto out = SplitStatements(
      "SELECT 1 -- first; still a comment\n;"
      "SELECT /* a; b */ 2;"
      "SELECT \"odd;name\", `x;y`, [z;w] FROM t");
  REQUIRE(out.size() == 3);
  REQUIRE(out[1] == "SELECT /* a; b */ 2");
}

TEST_CASE("SplitStatements: splitting again changes nothing", "[splitter]") {
  const char* scripts[] = {
      "INSERT INTO t VALUES ('a;b'); UPDATE t SET v = 'c''d;' ; DELETE FROM t",
      "CREATE TABLE periods (begin TEXT); INSERT INTO periods VALUES ('x')",
      "CREATE TRIGGER tr AFTER INSERT ON t BEGIN "
      "UPDATE t SET n = CASE WHEN n IS NULL THEN 1 ELSE n + 1 END; END; "
      "SELECT 1",
      "CREATE PROCEDURE p() BEGIN IF 1 THEN SELECT 1; END IF; END; SELECT 2",
  };
  for (const char* script : scripts) {
    auto first = SplitStatements(script);
    std::string joined;
    for (const std::string& stmt : first) { joined += stmt + ";\n"; }
    REQUIRE(SplitStatements(joined) == first);
  }
}
