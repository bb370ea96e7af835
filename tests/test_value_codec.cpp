// Copyright (c) 2026 The unidb Authors. MIT License.
// Tests for unidb value codec (date/time and boolean literals).

#include <catch2/catch_test_macros.hpp>
#include <ctime>
#include <string>

#include "unidb/value_codec.hpp"

using namespace unidb;

static std::string Ts(const char* text) {
  DateTime dt;
  REQUIRE(ParseDateTime(text, &dt));
  return FormatTimestamp(dt);
}

TEST_CASE("ParseDateTime: ISO forms", "[value_codec]") {
  REQUIRE(Ts("2024-03-05 14:30:09") == "2024-03-05 14:30:09");
  REQUIRE(Ts("2024-03-05T14:30:09Z") == "2024-03-05 14:30:09");
  REQUIRE(Ts("2024-03-05 14:30") == "2024-03-05 14:30:00");
  REQUIRE(Ts("2024-03-05") == "2024-03-05 00:00:00");
  REQUIRE(Ts("2024/03/05 01:02:03.250") == "2024-03-05 01:02:03");
}

TEST_CASE("ParseDateTime: zone suffix is ignored", "[value_codec]") {
  REQUIRE(Ts("2024-03-05 14:30:09+02:00") == "2024-03-05 14:30:09");
  REQUIRE(Ts("2024-03-05 14:30:09 UTC") == "2024-03-05 14:30:09");
  REQUIRE(Ts("2024-03-05 14:30:09-0500") == "2024-03-05 14:30:09");
}

TEST_CASE("ParseDateTime: US and textual forms", "[value_codec]") {
  REQUIRE(Ts("03/05/2024") == "2024-03-05 00:00:00");
  REQUIRE(Ts("5 March 2024") == "2024-03-05 00:00:00");
  REQUIRE(Ts("Mar 5, 2024 2:15 pm") == "2024-03-05 14:15:00");
  REQUIRE(Ts("'2024-03-05 12:00 am'") == "2024-03-05 00:00:00");
}

TEST_CASE("ParseDateTime: time only means today", "[value_codec]") {
  DateTime dt;
  REQUIRE(ParseDateTime("17:45:01", &dt));
  REQUIRE(FormatTime(dt) == "17:45:01");

  DateTime today;
  REQUIRE(ParseDateTime("today", &today));
  REQUIRE(FormatDate(dt) == FormatDate(today));
}

TEST_CASE("ParseDateTime: relative keywords", "[value_codec]") {
  DateTime today;
  DateTime tomorrow;
  REQUIRE(ParseDateTime("today", &today));
  REQUIRE(ParseDateTime("tomorrow", &tomorrow));
  REQUIRE(FormatTime(today) == "00:00:00");
  REQUIRE(FormatDate(today) != FormatDate(tomorrow));

  DateTime now;
  REQUIRE(ParseDateTime("now", &now));
}

TEST_CASE("ParseDateTime: epoch", "[value_codec]") {
  DateTime dt;
  REQUIRE(ParseDateTime("@0", &dt));
  REQUIRE_FALSE(ParseDateTime("@abc", &dt));
}

TEST_CASE("ParseDateTime: rejects garbage", "[value_codec]") {
  DateTime dt;
  REQUIRE_FALSE(ParseDateTime("", &dt));
  REQUIRE_FALSE(ParseDateTime("not a date", &dt));
  REQUIRE_FALSE(ParseDateTime("2024-02-30", &dt));
  REQUIRE_FALSE(ParseDateTime("2024-03-05 25:00", &dt));
  REQUIRE_FALSE(ParseDateTime("2024-03-05 10:00 tomorrow", &dt));
}

TEST_CASE("Format: canonical forms", "[value_codec]") {
  DateTime dt;
  dt.year = 999;
  dt.month = 1;
  dt.day = 2;
  dt.hour = 3;
  dt.minute = 4;
  dt.second = 5;
  REQUIRE(FormatTimestamp(dt) == "0999-01-02 03:04:05");
  REQUIRE(FormatDate(dt) == "0999-01-02");
  REQUIRE(FormatTime(dt) == "03:04:05");
}

TEST_CASE("BooleanLiteral: per family", "[value_codec]") {
  REQUIRE(BooleanLiteral(Family::kPostgresql, true) == "TRUE");
  REQUIRE(BooleanLiteral(Family::kMysql, false) == "FALSE");
  REQUIRE(BooleanLiteral(Family::kSqlite, true) == "'1'");
  REQUIRE(BooleanLiteral(Family::kMssql, false) == "'0'");
}

TEST_CASE("ParseBoolean: falsy values", "[value_codec]") {
  const char* falsy[] = {"", "0", "f", "FALSE", "n", "No", "off", "'f'",
                         " false "};
  for (const char* v : falsy) { REQUIRE_FALSE(ParseBoolean(v)); }
  REQUIRE_FALSE(ParseBoolean(nullptr));

  const char* truthy[] = {"1", "t", "true", "yes", "on", "Y", "2"};
  for (const char* v : truthy) { REQUIRE(ParseBoolean(v)); }
}

TEST_CASE("ParseDateTime: out of range epoch", "[value_codec]") {
  DateTime dt;
  REQUIRE_FALSE(ParseDateTime("@99999999999999999", &dt));
  REQUIRE_FALSE(ParseDateTime("@-99999999999999999", &dt));
  REQUIRE_FALSE(ParseDateTime("@999999999999999999999999", &dt));
  REQUIRE(ParseDateTime("@86400", &dt));
  REQUIRE(dt.year == 1970);
}

TEST_CASE("ParseDateTime: year outside 1..9999", "[value_codec]") {
  DateTime dt;
  REQUIRE_FALSE(ParseDateTime("0000-01-01", &dt));
  REQUIRE(ParseDateTime("9999-12-31 23:59:59", &dt));
}

TEST_CASE("BooleanLiteral: parses back for every family", "[value_codec]") {
  const Family families[] = {Family::kMssql, Family::kMysql,
                             Family::kPostgresql, Family::kSqlite};
  for (Family f : families) {
    REQUIRE(ParseBoolean(BooleanLiteral(f, true).c_str()));
    REQUIRE_FALSE(ParseBoolean(BooleanLiteral(f, false).c_str()));
  }
}
