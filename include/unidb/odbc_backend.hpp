// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::OdbcBackend -- generic client: MySQL, PostgreSQL or SQLite 3
// through an ODBC driver manager.
//
// Design:
//   - Owns one SQLHENV/SQLHDBC pair, statements live only inside Execute()
//   - Driver picked from the installed driver list (SQLDrivers)
//   - Row-returning vs. mutating told apart with SQLNumResultCols()
//   - Generated ids are read with the family's own SQL function
//   - Requires UNIDB_HAS_ODBC=1

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include <sql.h>
#include <sqlext.h>

#include "unidb/backend.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// ODBC helpers
// ---------------------------------------------------------------------------

namespace odbc_detail {

inline SQLCHAR* ToSqlChar(const char* s) {
  return const_cast<SQLCHAR*>(reinterpret_cast<const SQLCHAR*>(s));
}

inline std::string Diag(SQLSMALLINT handle_type, SQLHANDLE handle) {
  std::string out;
  SQLCHAR state[6] = {0};
  SQLCHAR text[1024];
  SQLINTEGER native_error = 0;
  SQLSMALLINT text_len = 0;
  for (SQLSMALLINT i = 1; i <= 8; ++i) {
    SQLRETURN rc = SQLGetDiagRec(handle_type, handle, i, state,
                                 &native_error, text, sizeof(text),
                                 &text_len);
    if (!SQL_SUCCEEDED(rc)) { break; }
    if (!out.empty()) { out += " | "; }
    out += "[";
    out += reinterpret_cast<const char*>(state);
    out += "] ";
    out += reinterpret_cast<const char*>(text);
  }
  return out.empty() ? std::string("no ODBC diagnostics") : out;
}

inline bool ContainsNoCase(const std::string& haystack, const char* needle) {
  std::string h;
  for (char c : haystack) {
    h.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return h.find(needle) != std::string::npos;
}

/// True when an ODBC driver description belongs to `family`.
inline bool DriverServes(const std::string& description, Family family) {
  switch (family) {
    case Family::kMysql:
      return ContainsNoCase(description, "mysql") ||
             ContainsNoCase(description, "mariadb");
    case Family::kPostgresql:
      return ContainsNoCase(description, "postgres");
    case Family::kSqlite:
      return ContainsNoCase(description, "sqlite3");
    case Family::kMssql:
      return false;
  }
  return false;
}

/// Descriptions of all drivers known to the driver manager.
inline std::vector<std::string> InstalledDrivers() {
  std::vector<std::string> drivers;
  SQLHENV env = SQL_NULL_HENV;
  if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env))) {
    return drivers;
  }
  SQLSetEnvAttr(env, SQL_ATTR_ODBC_VERSION,
                reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);

  SQLCHAR desc[256];
  SQLCHAR attrs[1024];
  SQLSMALLINT desc_len = 0;
  SQLSMALLINT attrs_len = 0;
  SQLUSMALLINT direction = SQL_FETCH_FIRST;
  while (SQL_SUCCEEDED(SQLDrivers(env, direction, desc, sizeof(desc),
                                  &desc_len, attrs, sizeof(attrs),
                                  &attrs_len))) {
    drivers.emplace_back(reinterpret_cast<const char*>(desc));
    direction = SQL_FETCH_NEXT;
  }
  SQLFreeHandle(SQL_HANDLE_ENV, env);
  return drivers;
}

/// Braces a connection string value when it contains separators.
inline std::string AttrValue(const std::string& value) {
  if (value.find_first_of(";{}") == std::string::npos) { return value; }
  std::string out = "{";
  for (char c : value) {
    out.push_back(c);
    if (c == '}') { out.push_back('}'); }
  }
  out.push_back('}');
  return out;
}

}  // namespace odbc_detail

// ---------------------------------------------------------------------------
// OdbcBackend
// ---------------------------------------------------------------------------

class OdbcBackend : public Backend {
 public:
  explicit OdbcBackend(Family family) : Backend(family) {}
  ~OdbcBackend() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kOdbc; }

  // --- Open / Close ---

  Error Connect(const Credentials& creds) override {
    Close();

    std::string driver;
    for (const std::string& d : odbc_detail::InstalledDrivers()) {
      if (odbc_detail::DriverServes(d, GetFamily())) {
        driver = d;
        break;
      }
    }
    if (driver.empty()) {
      Error err;
      err.SetFormat(ErrorCode::kConnectivity,
                    "No ODBC driver for %s is registered",
                    FamilyLabel(GetFamily()));
      return err;
    }

    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE,
                                      &env_))) {
      env_ = SQL_NULL_HENV;
      return Error::Make(ErrorCode::kConnectivity,
                         "SQLAllocHandle(ENV) failed");
    }
    SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION,
                  reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_))) {
      dbc_ = SQL_NULL_HDBC;
      Close();
      return Error::Make(ErrorCode::kConnectivity,
                         "SQLAllocHandle(DBC) failed");
    }

    std::string conn_str = BuildConnectionString(driver, creds);
    SQLCHAR out_str[1024];
    SQLSMALLINT out_len = 0;
    SQLRETURN ret = SQLDriverConnect(
        dbc_, nullptr, odbc_detail::ToSqlChar(conn_str.c_str()), SQL_NTS,
        out_str, sizeof(out_str), &out_len, SQL_DRIVER_NOPROMPT);
    if (!SQL_SUCCEEDED(ret)) {
      Error err;
      err.SetFormat(ErrorCode::kConnectivity,
                    "Unable to connect to database '%s': %s",
                    creds.database.c_str(),
                    odbc_detail::Diag(SQL_HANDLE_DBC, dbc_).c_str());
      SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
      dbc_ = SQL_NULL_HDBC;
      Close();
      return err;
    }
    connected_ = true;
    return Error::Ok();
  }

  void Close() override {
    if (dbc_ != SQL_NULL_HDBC) {
      if (connected_) { SQLDisconnect(dbc_); }
      SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
      dbc_ = SQL_NULL_HDBC;
    }
    if (env_ != SQL_NULL_HENV) {
      SQLFreeHandle(SQL_HANDLE_ENV, env_);
      env_ = SQL_NULL_HENV;
    }
    connected_ = false;
  }

  bool IsOpen() const override { return connected_; }

  std::vector<std::string> SessionSetup() const override {
    if (GetFamily() == Family::kMysql) {
      return {"SET sql_mode = 'ANSI,STRICT_ALL_TABLES'"};
    }
    return {};
  }

  // --- Execution ---

  bool Execute(Result* result) override {
    last_error_.clear();
    affected_ = 0;
    if (!connected_) {
      last_error_ = "Database not open";
      return false;
    }

    SQLHSTMT stmt = SQL_NULL_HSTMT;
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_STMT, dbc_, &stmt))) {
      last_error_ = odbc_detail::Diag(SQL_HANDLE_DBC, dbc_);
      return false;
    }

    SQLRETURN ret = SQLExecDirect(
        stmt, odbc_detail::ToSqlChar(result->Sql().c_str()), SQL_NTS);
    // SQL_NO_DATA: a searched UPDATE/DELETE that matched nothing
    if (!SQL_SUCCEEDED(ret) && ret != SQL_NO_DATA) {
      last_error_ = odbc_detail::Diag(SQL_HANDLE_STMT, stmt);
      SQLFreeHandle(SQL_HANDLE_STMT, stmt);
      return false;
    }

    SQLSMALLINT ncols = 0;
    SQLNumResultCols(stmt, &ncols);
    bool ok = true;
    if (ncols > 0) {
      ok = FetchRows(stmt, ncols, result);
    } else {
      SQLLEN count = 0;
      if (SQL_SUCCEEDED(SQLRowCount(stmt, &count)) && count > 0) {
        affected_ = static_cast<uint64_t>(count);
      }
    }
    SQLFreeHandle(SQL_HANDLE_STMT, stmt);
    if (!ok) { return false; }

    result->SetReturnedRows(result->NumRows());
    result->SetSuccess(true);
    return true;
  }

  std::string LastError() const override { return last_error_; }

  uint64_t RowsAffected(const Result& result) override {
    return result.HasRows() ? 0 : affected_;
  }

  bool LastInsertId(const Result& /*result*/, int64_t* out_id) override {
    if (!connected_) { return false; }
    std::string value;
    switch (GetFamily()) {
      case Family::kMysql:
        if (!Scalar("SELECT LAST_INSERT_ID()", &value)) { return false; }
        break;
      case Family::kSqlite:
        if (!Scalar("SELECT last_insert_rowid()", &value)) { return false; }
        break;
      case Family::kPostgresql:
        if (!PgLastValue(&value)) { return false; }
        break;
      case Family::kMssql:
        return false;
    }
    int64_t id = std::strtoll(value.c_str(), nullptr, 10);
    if (id == 0) { return false; }
    *out_id = id;
    return true;
  }

  // --- Escaping ---

  std::string EscapeString(const std::string& value) override {
    return Quote(value);
  }

  std::string EscapeBlob(const std::string& value) override {
    return Quote(value);
  }

 private:
  std::string BuildConnectionString(const std::string& driver,
                                    const Credentials& creds) const {
    std::string s = "DRIVER={" + driver + "};";
    if (GetFamily() == Family::kSqlite) {
      s += "DATABASE=" + odbc_detail::AttrValue(creds.database) + ";";
      return s;
    }
    if (!creds.host.empty()) {
      s += "SERVER=" + odbc_detail::AttrValue(creds.host) + ";";
    }
    if (creds.HasPort()) { s += "PORT=" + std::to_string(creds.port) + ";"; }
    s += "DATABASE=" + odbc_detail::AttrValue(creds.database) + ";";
    if (!creds.username.empty()) {
      s += "UID=" + odbc_detail::AttrValue(creds.username) + ";";
    }
    if (!creds.password.empty()) {
      s += "PWD=" + odbc_detail::AttrValue(creds.password) + ";";
    }
    return s;
  }

  /// Driver-independent quoting in the family's literal syntax.
  std::string Quote(const std::string& value) const {
    if (GetFamily() != Family::kMysql) { return QuoteDoubling(value); }
    std::string out = "'";
    for (char c : value) {
      switch (c) {
        case '\0':   out += "\\0"; break;
        case '\n':   out += "\\n"; break;
        case '\r':   out += "\\r"; break;
        case '\\':   out += "\\\\"; break;
        case '\'':   out += "\\'"; break;
        case '"':    out += "\\\""; break;
        case '\x1a': out += "\\Z"; break;
        default:     out.push_back(c); break;
      }
    }
    out += "'";
    return out;
  }

  bool FetchRows(SQLHSTMT stmt, SQLSMALLINT ncols, Result* result) {
    std::vector<SQLSMALLINT> c_types;
    for (SQLSMALLINT c = 1; c <= ncols; ++c) {
      SQLCHAR name[256];
      SQLSMALLINT name_len = 0;
      SQLSMALLINT data_type = 0;
      SQLULEN size = 0;
      SQLSMALLINT digits = 0;
      SQLSMALLINT nullable = 0;
      SQLDescribeCol(stmt, static_cast<SQLUSMALLINT>(c), name, sizeof(name),
                     &name_len, &data_type, &size, &digits, &nullable);
      result->AddColumn(reinterpret_cast<const char*>(name));
      bool binary = data_type == SQL_BINARY || data_type == SQL_VARBINARY ||
                    data_type == SQL_LONGVARBINARY;
      c_types.push_back(binary ? SQL_C_BINARY : SQL_C_CHAR);
    }

    SQLRETURN ret;
    while ((ret = SQLFetch(stmt)) != SQL_NO_DATA) {
      if (!SQL_SUCCEEDED(ret)) {
        last_error_ = odbc_detail::Diag(SQL_HANDLE_STMT, stmt);
        return false;
      }
      result->BeginRow();
      for (SQLSMALLINT c = 1; c <= ncols; ++c) {
        if (!FetchField(stmt, c, c_types[static_cast<size_t>(c - 1)],
                        result)) {
          return false;
        }
      }
    }
    return true;
  }

  // Long values arrive in chunks, SQL_SUCCESS_WITH_INFO means "more"
  bool FetchField(SQLHSTMT stmt, SQLSMALLINT col, SQLSMALLINT c_type,
                  Result* result) {
    std::string value;
    bool is_null = false;
    char buf[1024];
    const size_t avail = (c_type == SQL_C_CHAR) ? sizeof(buf) - 1
                                                 : sizeof(buf);
    for (;;) {
      SQLLEN ind = 0;
      SQLRETURN ret = SQLGetData(stmt, static_cast<SQLUSMALLINT>(col), c_type,
                                 buf, sizeof(buf), &ind);
      if (ret == SQL_NO_DATA) { break; }
      if (!SQL_SUCCEEDED(ret)) {
        last_error_ = odbc_detail::Diag(SQL_HANDLE_STMT, stmt);
        return false;
      }
      if (ind == SQL_NULL_DATA) {
        is_null = true;
        break;
      }
      size_t got = (ind == SQL_NO_TOTAL || ind > static_cast<SQLLEN>(avail))
                       ? avail
                       : static_cast<size_t>(ind);
      value.append(buf, got);
      if (ret == SQL_SUCCESS) { break; }
    }
    if (is_null) {
      result->AddNull();
    } else {
      result->AddField(value.data(), value.size());
    }
    return true;
  }

  bool Command(const char* sql) {
    SQLHSTMT stmt = SQL_NULL_HSTMT;
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_STMT, dbc_, &stmt))) {
      return false;
    }
    SQLRETURN ret = SQLExecDirect(stmt, odbc_detail::ToSqlChar(sql), SQL_NTS);
    SQLFreeHandle(SQL_HANDLE_STMT, stmt);
    return SQL_SUCCEEDED(ret) || ret == SQL_NO_DATA;
  }

  bool Scalar(const char* sql, std::string* out) {
    Result scratch{std::string(sql)};
    std::string saved_error = last_error_;
    uint64_t saved_affected = affected_;
    bool ok = Execute(&scratch) && scratch.NumRows() > 0 &&
              !scratch.FieldIsNull(0);
    if (ok) { *out = scratch.GetString(0); }
    last_error_ = saved_error;
    affected_ = saved_affected;
    return ok;
  }

  // SAVEPOINT only succeeds inside a transaction block; outside one the
  // plain read cannot disturb anything
  bool PgLastValue(std::string* out) {
    bool in_transaction = Command("SAVEPOINT unidb_last_val");
    bool ok = Scalar("SELECT lastval()", out);
    if (in_transaction) {
      if (!ok) { Command("ROLLBACK TO SAVEPOINT unidb_last_val"); }
      Command("RELEASE SAVEPOINT unidb_last_val");
    }
    return ok;
  }

  SQLHENV env_ = SQL_NULL_HENV;
  SQLHDBC dbc_ = SQL_NULL_HDBC;
  bool connected_ = false;
  uint64_t affected_ = 0;
  std::string last_error_;
};

}  // namespace unidb
