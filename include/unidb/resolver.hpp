// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::ResolveBackend -- picks the client library for a family.
//
// Design:
//   - Capabilities describes what this host can talk with: the libraries
//     compiled in (UNIDB_HAS_* macros) plus the ODBC drivers registered
//     at run time
//   - Resolution is a pure function of (family, database, capabilities),
//     never a silent fallback
//   - SQLite files are identified by their header bytes

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <sys/stat.h>

#include "unidb/backend.hpp"
#include "unidb/error.hpp"
#include "unidb/family.hpp"

#if UNIDB_HAS_SQLITE3
#include "unidb/sqlite3_backend.hpp"
#endif
#if defined(UNIDB_HAS_SQLITE2) && UNIDB_HAS_SQLITE2
#include "unidb/sqlite2_backend.hpp"
#endif
#if defined(UNIDB_HAS_MARIADB) && UNIDB_HAS_MARIADB
#include "unidb/maria_backend.hpp"
#endif
#if defined(UNIDB_HAS_LIBPQ) && UNIDB_HAS_LIBPQ
#include "unidb/pg_backend.hpp"
#endif
#if defined(UNIDB_HAS_FREETDS) && UNIDB_HAS_FREETDS
#include "unidb/mssql_backend.hpp"
#endif
#if defined(UNIDB_HAS_ODBC) && UNIDB_HAS_ODBC
#include "unidb/odbc_backend.hpp"
#endif

namespace unidb {

// ---------------------------------------------------------------------------
// Capabilities
// ---------------------------------------------------------------------------

struct Capabilities {
  bool freetds = false;
  bool mysql = false;
  bool libpq = false;
  bool sqlite3 = false;
  bool sqlite2 = false;

  // ODBC driver manager present, and the families it has drivers for
  bool odbc = false;
  bool odbc_mysql = false;
  bool odbc_postgresql = false;
  bool odbc_sqlite = false;

  bool OdbcServes(Family family) const {
    if (!odbc) { return false; }
    switch (family) {
      case Family::kMysql:      return odbc_mysql;
      case Family::kPostgresql: return odbc_postgresql;
      case Family::kSqlite:     return odbc_sqlite;
      case Family::kMssql:      return false;
    }
    return false;
  }

  /// What this build and host provide.
  static Capabilities Detect() {
    Capabilities caps;
#if UNIDB_HAS_SQLITE3
    caps.sqlite3 = true;
#endif
#if defined(UNIDB_HAS_SQLITE2) && UNIDB_HAS_SQLITE2
    caps.sqlite2 = true;
#endif
#if defined(UNIDB_HAS_MARIADB) && UNIDB_HAS_MARIADB
    caps.mysql = true;
#endif
#if defined(UNIDB_HAS_LIBPQ) && UNIDB_HAS_LIBPQ
    caps.libpq = true;
#endif
#if defined(UNIDB_HAS_FREETDS) && UNIDB_HAS_FREETDS
    caps.freetds = true;
#endif
#if defined(UNIDB_HAS_ODBC) && UNIDB_HAS_ODBC
    caps.odbc = true;
    for (const std::string& d : odbc_detail::InstalledDrivers()) {
      caps.odbc_mysql |= odbc_detail::DriverServes(d, Family::kMysql);
      caps.odbc_postgresql |= odbc_detail::DriverServes(d, Family::kPostgresql);
      caps.odbc_sqlite |= odbc_detail::DriverServes(d, Family::kSqlite);
    }
#endif
    return caps;
  }
};

// ---------------------------------------------------------------------------
// SQLite file format
// ---------------------------------------------------------------------------

enum class SqliteFormat : int32_t {
  kUnknown = 0,  // no file yet: either client will do
  kV2 = 2,
  kV3 = 3,
};

/// Inspect the first 64 bytes of an existing SQLite file.
inline SqliteFormat DetectSqliteFormat(const std::string& path,
                                       Error* out_error = nullptr) {
  if (path.empty() || path == ":memory:") { return SqliteFormat::kUnknown; }

  struct stat st;
  if (::stat(path.c_str(), &st) != 0 || st.st_size == 0) {
    return SqliteFormat::kUnknown;
  }

  std::FILE* fp = std::fopen(path.c_str(), "rb");
  if (fp == nullptr) {
    if (out_error != nullptr) {
      out_error->SetFormat(ErrorCode::kConnectivity,
                           "Unable to read the database specified: '%s'",
                           path.c_str());
    }
    return SqliteFormat::kUnknown;
  }
  char header[65] = {};
  size_t n = std::fread(header, 1, 64, fp);
  std::fclose(fp);

  // The v3 header holds a NUL after the magic string, search the raw bytes
  std::string bytes(header, n);
  if (bytes.find("SQLite format 3") != std::string::npos) {
    return SqliteFormat::kV3;
  }
  if (bytes.find("** This file contains an SQLite 2.1 database **") !=
      std::string::npos) {
    return SqliteFormat::kV2;
  }

  if (out_error != nullptr) {
    out_error->SetFormat(ErrorCode::kConnectivity,
                         "The database specified does not appear to be a "
                         "valid SQLite v2.1 or v3 database: '%s'",
                         path.c_str());
  }
  return SqliteFormat::kUnknown;
}

// ---------------------------------------------------------------------------
// ResolveBackend
// ---------------------------------------------------------------------------

namespace resolver_detail {

inline BackendKind ResolveSqlite(const std::string& database,
                                 const Capabilities& caps, Error* err) {
  Error format_err;
  SqliteFormat format = DetectSqliteFormat(database, &format_err);
  if (!format_err.ok()) {
    *err = format_err;
    return BackendKind::kNone;
  }

  bool modern_ok = format != SqliteFormat::kV2;
  bool legacy_ok = format != SqliteFormat::kV3;

  if (modern_ok && caps.sqlite3) { return BackendKind::kSqlite3; }
  if (modern_ok && caps.OdbcServes(Family::kSqlite)) {
    return BackendKind::kOdbc;
  }
  if (legacy_ok && caps.sqlite2) { return BackendKind::kSqlite2; }

  if (format == SqliteFormat::kV3) {
    if (caps.sqlite2) {
      err->Set(ErrorCode::kEnvironment,
               "The database specified is an SQLite v3 database and only "
               "the SQLite v2 client is installed (need libsqlite3 or an "
               "ODBC SQLite3 driver)");
    } else {
      err->Set(ErrorCode::kEnvironment,
               "The database specified is an SQLite v3 database and no "
               "SQLite v3 client is installed (libsqlite3, ODBC SQLite3 "
               "driver)");
    }
  } else if (format == SqliteFormat::kV2) {
    if (caps.sqlite3 || caps.OdbcServes(Family::kSqlite)) {
      err->Set(ErrorCode::kEnvironment,
               "The database specified is an SQLite v2.1 database and only "
               "an SQLite v3 client is installed (need libsqlite 2.x)");
    } else {
      err->Set(ErrorCode::kEnvironment,
               "The database specified is an SQLite v2.1 database and the "
               "SQLite v2 client is not installed");
    }
  } else {
    err->Set(ErrorCode::kEnvironment,
             "The server does not have any of the following clients for "
             "SQLite support: libsqlite3, ODBC SQLite3 driver, libsqlite 2.x");
  }
  return BackendKind::kNone;
}

}  // namespace resolver_detail

/// Pick the client library for `family`. `database` is only consulted for
/// SQLite, where it names the data file.
inline BackendKind ResolveBackend(Family family, const std::string& database,
                                  const Capabilities& caps,
                                  Error* out_error = nullptr) {
  Error err;
  BackendKind kind = BackendKind::kNone;

  switch (family) {
    case Family::kMssql:
      if (caps.freetds) {
        kind = BackendKind::kMssql;
      } else {
        err.Set(ErrorCode::kEnvironment,
                "The server does not have any of the following clients for "
                "MSSQL support: FreeTDS DB-Library");
      }
      break;

    case Family::kMysql:
      if (caps.mysql) {
        kind = BackendKind::kMysql;
      } else if (caps.OdbcServes(Family::kMysql)) {
        kind = BackendKind::kOdbc;
      } else {
        err.Set(ErrorCode::kEnvironment,
                "The server does not have any of the following clients for "
                "MySQL support: MySQL/MariaDB C API, ODBC MySQL driver");
      }
      break;

    case Family::kPostgresql:
      if (caps.libpq) {
        kind = BackendKind::kPgsql;
      } else if (caps.OdbcServes(Family::kPostgresql)) {
        kind = BackendKind::kOdbc;
      } else {
        err.Set(ErrorCode::kEnvironment,
                "The server does not have any of the following clients for "
                "PostgreSQL support: libpq, ODBC PostgreSQL driver");
      }
      break;

    case Family::kSqlite:
      kind = resolver_detail::ResolveSqlite(database, caps, &err);
      break;

    default:
      err.Set(ErrorCode::kProgrammer, "Invalid database type specified");
      break;
  }

  Report(out_error, err);
  return kind;
}

// ---------------------------------------------------------------------------
// MakeBackend
// ---------------------------------------------------------------------------

/// Instantiate a resolved backend. Returns nullptr (kEnvironment) when the
/// library was not compiled into this build.
inline std::unique_ptr<Backend> MakeBackend(BackendKind kind, Family family,
                                            Error* out_error = nullptr) {
  (void)family;
  std::unique_ptr<Backend> backend;
  switch (kind) {
#if UNIDB_HAS_SQLITE3
    case BackendKind::kSqlite3:
      backend.reset(new Sqlite3Backend());
      break;
#endif
#if defined(UNIDB_HAS_SQLITE2) && UNIDB_HAS_SQLITE2
    case BackendKind::kSqlite2:
      backend.reset(new Sqlite2Backend());
      break;
#endif
#if defined(UNIDB_HAS_MARIADB) && UNIDB_HAS_MARIADB
    case BackendKind::kMysql:
      backend.reset(new MariaBackend());
      break;
#endif
#if defined(UNIDB_HAS_LIBPQ) && UNIDB_HAS_LIBPQ
    case BackendKind::kPgsql:
      backend.reset(new PgBackend());
      break;
#endif
#if defined(UNIDB_HAS_FREETDS) && UNIDB_HAS_FREETDS
    case BackendKind::kMssql:
      backend.reset(new MssqlBackend());
      break;
#endif
#if defined(UNIDB_HAS_ODBC) && UNIDB_HAS_ODBC
    case BackendKind::kOdbc:
      backend.reset(new OdbcBackend(family));
      break;
#endif
    default:
      break;
  }

  if (backend == nullptr && out_error != nullptr) {
    out_error->SetFormat(ErrorCode::kEnvironment,
                         "The %s client is not available in this build",
                         BackendName(kind));
  }
  return backend;
}

}  // namespace unidb
