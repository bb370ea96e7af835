// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::MssqlBackend -- Microsoft SQL Server through FreeTDS DB-Library.
//
// Design:
//   - Wraps DBPROCESS* with RAII
//   - Server messages reach the owning backend through dbsetuserdata(), so
//     each connection keeps its own last message
//   - No native quoting primitive: strings double embedded quotes, blobs
//     are 0x hex literals
//   - Affected rows and identity values are read with follow-up SELECTs
//   - Requires UNIDB_HAS_FREETDS=1

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <sybdb.h>

#include "unidb/backend.hpp"

namespace unidb {

namespace mssql_detail {

/// Character buffer that holds `len` source bytes converted to SYBCHAR plus
/// the terminating NUL: two hex digits per byte for binary types, at most
/// 1.5x for UTF-16 to UTF-8, and a fixed margin for numeric and date types.
inline size_t ConvertBufferSize(DBINT len) {
  size_t n = (len > 0) ? static_cast<size_t>(len) : 0;
  return n * 2 + 64;
}

}  // namespace mssql_detail

// ---------------------------------------------------------------------------
// MssqlBackend
// ---------------------------------------------------------------------------

class MssqlBackend : public Backend {
 public:
  MssqlBackend() : Backend(Family::kMssql) {}
  ~MssqlBackend() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kMssql; }

  // --- Open / Close ---

  Error Connect(const Credentials& creds) override {
    Close();

    if (dbinit() == FAIL) {
      return Error::Make(ErrorCode::kConnectivity, "dbinit failed");
    }
    dberrhandle(&MssqlBackend::OnError);
    dbmsghandle(&MssqlBackend::OnMessage);

    LOGINREC* login = dblogin();
    if (login == nullptr) {
      return Error::Make(ErrorCode::kConnectivity, "dblogin failed");
    }
    DBSETLUSER(login, creds.username.c_str());
    DBSETLPWD(login, creds.password.c_str());
    DBSETLAPP(login, "unidb");

    ConnectMessage().clear();
    dbproc_ = dbopen(login, creds.HostAndPort().c_str());
    dbloginfree(login);

    if (dbproc_ == nullptr) {
      Error err;
      err.SetFormat(ErrorCode::kConnectivity,
                    "Unable to connect to server '%s': %s",
                    creds.HostAndPort().c_str(),
                    ConnectMessage().empty() ? "dbopen failed"
                                             : ConnectMessage().c_str());
      return err;
    }
    dbsetuserdata(dbproc_, reinterpret_cast<BYTE*>(this));

    if (!creds.database.empty() &&
        dbuse(dbproc_, creds.database.c_str()) == FAIL) {
      Error err;
      err.SetFormat(ErrorCode::kConnectivity,
                    "Unable to select database '%s': %s",
                    creds.database.c_str(), message_.c_str());
      Close();
      return err;
    }
    return Error::Ok();
  }

  void Close() override {
    if (dbproc_ != nullptr) {
      dbclose(dbproc_);
      dbproc_ = nullptr;
    }
  }

  bool IsOpen() const override { return dbproc_ != nullptr; }

  std::vector<std::string> SessionSetup() const override {
    return {"SET TEXTSIZE 65536"};
  }

  // --- Execution ---

  bool Execute(Result* result) override {
    last_error_.clear();
    if (dbproc_ == nullptr) {
      last_error_ = "Database not open";
      return false;
    }

    message_.clear();
    if (dbcmd(dbproc_, result->Sql().c_str()) == FAIL ||
        dbsqlexec(dbproc_) == FAIL) {
      last_error_ = message_.empty() ? "dbsqlexec failed" : message_;
      dbcancel(dbproc_);
      return false;
    }

    bool have_rows = false;
    RETCODE rc;
    while ((rc = dbresults(dbproc_)) != NO_MORE_RESULTS) {
      if (rc == FAIL) {
        last_error_ = message_.empty() ? "dbresults failed" : message_;
        dbcancel(dbproc_);
        return false;
      }
      int ncols = dbnumcols(dbproc_);
      if (ncols > 0 && !have_rows) {
        have_rows = true;
        if (!FetchRows(ncols, result)) { return false; }
      } else {
        dbcanquery(dbproc_);
      }
    }

    result->SetReturnedRows(result->NumRows());
    result->SetSuccess(true);
    return true;
  }

  std::string LastError() const override { return last_error_; }

  uint64_t RowsAffected(const Result& result) override {
    if (dbproc_ == nullptr || result.HasRows()) { return 0; }
    std::string value;
    if (!Scalar("SELECT @@ROWCOUNT AS affected_rows", &value)) { return 0; }
    return std::strtoull(value.c_str(), nullptr, 10);
  }

  bool LastInsertId(const Result& /*result*/, int64_t* out_id) override {
    if (dbproc_ == nullptr) { return false; }
    std::string value;
    if (!Scalar("SELECT @@IDENTITY AS insert_id", &value)) { return false; }
    *out_id = std::strtoll(value.c_str(), nullptr, 10);
    return true;
  }

  // --- Escaping ---

  std::string EscapeString(const std::string& value) override {
    return QuoteDoubling(value);
  }

  std::string EscapeBlob(const std::string& value) override {
    return "0x" + HexEncode(value);
  }

  DBPROCESS* Handle() const { return dbproc_; }

 private:
  // Messages raised before a DBPROCESS exists (dbopen failures)
  static std::string& ConnectMessage() {
    static thread_local std::string message;
    return message;
  }

  static MssqlBackend* Owner(DBPROCESS* dbproc) {
    if (dbproc == nullptr) { return nullptr; }
    return reinterpret_cast<MssqlBackend*>(dbgetuserdata(dbproc));
  }

  static int OnError(DBPROCESS* dbproc, int /*severity*/, int /*dberr*/,
                     int /*oserr*/, char* dberrstr, char* oserrstr) {
    std::string text = (dberrstr != nullptr) ? dberrstr : "";
    if (oserrstr != nullptr && *oserrstr != '\0') {
      text += " (";
      text += oserrstr;
      text += ")";
    }
    MssqlBackend* owner = Owner(dbproc);
    std::string& target = owner ? owner->message_ : ConnectMessage();
    if (target.empty()) { target = text; }
    return INT_CANCEL;
  }

  static int OnMessage(DBPROCESS* dbproc, DBINT /*msgno*/, int /*msgstate*/,
                       int severity, char* msgtext, char* /*srvname*/,
                       char* /*proc*/, int /*line*/) {
    // Severity 10 and below is informational ("Changed database context")
    if (severity <= 10 || msgtext == nullptr) { return 0; }
    MssqlBackend* owner = Owner(dbproc);
    std::string& target = owner ? owner->message_ : ConnectMessage();
    target = msgtext;
    return 0;
  }

  bool FetchRows(int ncols, Result* result) {
    for (int c = 1; c <= ncols; ++c) {
      result->AddColumn(dbcolname(dbproc_, c));
    }
    STATUS row;
    while ((row = dbnextrow(dbproc_)) != NO_MORE_ROWS) {
      if (row == FAIL) {
        last_error_ = message_.empty() ? "dbnextrow failed" : message_;
        dbcancel(dbproc_);
        return false;
      }
      if (row != REG_ROW) { continue; }
      result->BeginRow();
      for (int c = 1; c <= ncols; ++c) { AddColumnValue(c, result); }
    }
    return true;
  }

  void AddColumnValue(int col, Result* result) {
    BYTE* data = dbdata(dbproc_, col);
    DBINT len = dbdatlen(dbproc_, col);
    if (data == nullptr && len == 0) {
      result->AddNull();
      return;
    }
    int type = dbcoltype(dbproc_, col);
    if (type == SYBCHAR || type == SYBVARCHAR || type == SYBTEXT ||
        type == SYBBINARY || type == SYBVARBINARY || type == SYBIMAGE) {
      result->AddField(reinterpret_cast<const char*>(data),
                       static_cast<size_t>(len));
      return;
    }
    if (!dbwillconvert(type, SYBCHAR)) {
      result->AddNull();
      return;
    }
    std::vector<char> buf(mssql_detail::ConvertBufferSize(len), '\0');
    DBINT n = dbconvert(dbproc_, type, data, len, SYBCHAR,
                        reinterpret_cast<BYTE*>(buf.data()), -1);
    if (n < 0) {
      result->AddNull();
      return;
    }
    result->AddField(buf.data(), std::strlen(buf.data()));
  }

  bool Scalar(const char* sql, std::string* out) {
    if (dbcmd(dbproc_, sql) == FAIL || dbsqlexec(dbproc_) == FAIL) {
      dbcancel(dbproc_);
      return false;
    }
    Result scratch;
    bool found = false;
    RETCODE rc;
    while ((rc = dbresults(dbproc_)) != NO_MORE_RESULTS) {
      if (rc == FAIL) { return false; }
      if (!found && dbnumcols(dbproc_) > 0) {
        found = FetchRows(dbnumcols(dbproc_), &scratch);
      } else {
        dbcanquery(dbproc_);
      }
    }
    if (!found || scratch.NumRows() == 0 || scratch.FieldIsNull(0)) {
      return false;
    }
    *out = scratch.GetString(0);
    return true;
  }

  DBPROCESS* dbproc_ = nullptr;
  std::string message_;
  std::string last_error_;
};

}  // namespace unidb
