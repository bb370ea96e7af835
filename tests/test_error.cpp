// Copyright (c) 2026 The unidb Authors. MIT License.
// Tests for unidb::Error.

#include <catch2/catch_test_macros.hpp>
#include <cstring>

#include "unidb/error.hpp"

using namespace unidb;

TEST_CASE("Error: default is ok", "[error]") {
  Error err;
  REQUIRE(err.ok());
  REQUIRE(static_cast<bool>(err));
  REQUIRE(err.code == ErrorCode::kOk);
}

TEST_CASE("Error: Make() factory", "[error]") {
  Error err = Error::Make(ErrorCode::kSql, "syntax error");
  REQUIRE_FALSE(err.ok());
  REQUIRE(err.IsSql());
  REQUIRE(std::strcmp(err.message, "syntax error") == 0);
}

TEST_CASE("Error: Make() without message", "[error]") {
  Error err = Error::Make(ErrorCode::kNotOpen);
  REQUIRE_FALSE(err.ok());
  REQUIRE(err.message[0] == '\0');
}

TEST_CASE("Error: category helpers", "[error]") {
  REQUIRE(Error::Make(ErrorCode::kProgrammer).IsProgrammer());
  REQUIRE(Error::Make(ErrorCode::kNotOpen).IsProgrammer());
  REQUIRE(Error::Make(ErrorCode::kEnvironment).IsEnvironment());
  REQUIRE(Error::Make(ErrorCode::kConnectivity).IsConnectivity());
  REQUIRE_FALSE(Error::Make(ErrorCode::kSql).IsConnectivity());
}

TEST_CASE("Error: SetFormat()", "[error]") {
  Error err;
  err.SetFormat(ErrorCode::kSql, "%s error (%s) in %s", "SQLite",
                "no such table: t", "SELECT * FROM t");
  REQUIRE(err.IsSql());
  REQUIRE(std::strcmp(err.message,
                      "SQLite error (no such table: t) in SELECT * FROM t") ==
          0);
}

TEST_CASE("Error: Clear()", "[error]") {
  Error err = Error::Make(ErrorCode::kConnectivity, "refused");
  err.Clear();
  REQUIRE(err.ok());
  REQUIRE(err.message[0] == '\0');
}

TEST_CASE("Error: Report() only writes when asked", "[error]") {
  Report(nullptr, Error::Make(ErrorCode::kSql, "ignored"));

  Error out;
  Report(&out, Error::Make(ErrorCode::kEnvironment, "no client"));
  REQUIRE(out.IsEnvironment());
  Report(&out, Error::Ok());
  REQUIRE(out.ok());
}

TEST_CASE("Error: message truncation", "[error]") {
  char long_msg[2048];
  std::memset(long_msg, 'x', sizeof(long_msg) - 1);
  long_msg[sizeof(long_msg) - 1] = '\0';

  Error err;
  err.Set(ErrorCode::kSql, long_msg);
  REQUIRE(std::strlen(err.message) == Error::kMaxMessageLen - 1);
}

TEST_CASE("Error: code names", "[error]") {
  REQUIRE(std::strcmp(ErrorCodeName(ErrorCode::kOk), "Ok") == 0);
  REQUIRE(std::strcmp(ErrorCodeName(ErrorCode::kSql), "SQLError") == 0);
}
