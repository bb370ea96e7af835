// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Family / unidb::BackendKind -- database families and the client
// libraries able to reach them.
//
// Design:
//   - Family is the logical product, BackendKind the concrete client library
//   - Textual names match the ones accepted by Database::Open()

#pragma once

#include <cstdint>
#include <cstring>

#include "unidb/error.hpp"

#ifndef UNIDB_HAS_SQLITE3
#define UNIDB_HAS_SQLITE3 1
#endif

namespace unidb {

// ---------------------------------------------------------------------------
// Family
// ---------------------------------------------------------------------------

enum class Family : int32_t {
  kMssql = 0,
  kMysql = 1,
  kPostgresql = 2,
  kSqlite = 3,
};

inline bool IsValidFamily(Family family) {
  int32_t v = static_cast<int32_t>(family);
  return v >= static_cast<int32_t>(Family::kMssql) &&
         v <= static_cast<int32_t>(Family::kSqlite);
}

/// Name accepted by ParseFamily(): mssql, mysql, postgresql, sqlite.
inline const char* FamilyName(Family family) {
  switch (family) {
    case Family::kMssql:      return "mssql";
    case Family::kMysql:      return "mysql";
    case Family::kPostgresql: return "postgresql";
    case Family::kSqlite:     return "sqlite";
  }
  return "unknown";
}

/// Product name used in diagnostics ("PostgreSQL error (...) in ...").
inline const char* FamilyLabel(Family family) {
  switch (family) {
    case Family::kMssql:      return "MSSQL";
    case Family::kMysql:      return "MySQL";
    case Family::kPostgresql: return "PostgreSQL";
    case Family::kSqlite:     return "SQLite";
  }
  return "Unknown";
}

inline Error ParseFamily(const char* name, Family* out) {
  if (name == nullptr) {
    return Error::Make(ErrorCode::kProgrammer, "Database type is null");
  }
  static const Family kAll[] = {Family::kMssql, Family::kMysql,
                                Family::kPostgresql, Family::kSqlite};
  for (Family f : kAll) {
    if (std::strcmp(name, FamilyName(f)) == 0) {
      if (out != nullptr) { *out = f; }
      return Error::Ok();
    }
  }
  Error err;
  err.SetFormat(ErrorCode::kProgrammer,
                "Invalid database type specified: '%s' (expected mssql, "
                "mysql, postgresql or sqlite)", name);
  return err;
}

// ---------------------------------------------------------------------------
// BackendKind
// ---------------------------------------------------------------------------

enum class BackendKind : int32_t {
  kNone = 0,
  kMssql,    // FreeTDS DB-Library
  kMysql,    // MySQL / MariaDB C API
  kPgsql,    // libpq
  kSqlite3,  // libsqlite3
  kSqlite2,  // legacy SQLite 2.x library
  kOdbc,     // ODBC driver manager
};

inline const char* BackendName(BackendKind kind) {
  switch (kind) {
    case BackendKind::kNone:    return "none";
    case BackendKind::kMssql:   return "mssql";
    case BackendKind::kMysql:   return "mysql";
    case BackendKind::kPgsql:   return "pgsql";
    case BackendKind::kSqlite3: return "sqlite3";
    case BackendKind::kSqlite2: return "sqlite2";
    case BackendKind::kOdbc:    return "odbc";
  }
  return "unknown";
}

}  // namespace unidb
