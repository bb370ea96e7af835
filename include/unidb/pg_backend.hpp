// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::PgBackend -- PostgreSQL family through libpq.
//
// Design:
//   - Wraps PGconn* with RAII, keeps the last PGresult* for metadata
//   - Conninfo values are single-quoted; port only when explicitly set
//   - lastval() is read inside a savepoint when a transaction is open, so
//     a failing read never aborts the caller's transaction
//   - Requires UNIDB_HAS_LIBPQ=1

#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

#include <libpq-fe.h>

#include "unidb/backend.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// PgBackend
// ---------------------------------------------------------------------------

class PgBackend : public Backend {
 public:
  PgBackend() : Backend(Family::kPostgresql) {}
  ~PgBackend() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kPgsql; }

  // --- Open / Close ---

  Error Connect(const Credentials& creds) override {
    Close();

    std::string conninfo;
    AppendParam(&conninfo, "host", creds.host);
    AppendParam(&conninfo, "dbname", creds.database);
    AppendParam(&conninfo, "user", creds.username);
    AppendParam(&conninfo, "password", creds.password);
    if (creds.HasPort()) {
      AppendParam(&conninfo, "port", std::to_string(creds.port));
    }

    conn_ = PQconnectdb(conninfo.c_str());
    if (conn_ == nullptr || PQstatus(conn_) != CONNECTION_OK) {
      Error err;
      err.SetFormat(ErrorCode::kConnectivity,
                    "Unable to connect to database '%s': %s",
                    creds.database.c_str(),
                    conn_ ? TrimmedMessage(PQerrorMessage(conn_)).c_str()
                          : "out of memory");
      if (conn_ != nullptr) {
        PQfinish(conn_);
        conn_ = nullptr;
      }
      return err;
    }
    return Error::Ok();
  }

  void Close() override {
    ClearResult();
    if (conn_ != nullptr) {
      PQfinish(conn_);
      conn_ = nullptr;
    }
  }

  bool IsOpen() const override { return conn_ != nullptr; }

  // --- Execution ---

  bool Execute(Result* result) override {
    last_error_.clear();
    ClearResult();
    if (conn_ == nullptr) {
      last_error_ = "Database not open";
      return false;
    }

    last_result_ = PQexec(conn_, result->Sql().c_str());
    if (last_result_ == nullptr) {
      last_error_ = TrimmedMessage(PQerrorMessage(conn_));
      return false;
    }

    ExecStatusType status = PQresultStatus(last_result_);
    if (status == PGRES_TUPLES_OK) {
      int ncols = PQnfields(last_result_);
      int nrows = PQntuples(last_result_);
      for (int c = 0; c < ncols; ++c) {
        result->AddColumn(PQfname(last_result_, c));
      }
      for (int r = 0; r < nrows; ++r) {
        result->BeginRow();
        for (int c = 0; c < ncols; ++c) {
          if (PQgetisnull(last_result_, r, c)) {
            result->AddNull();
          } else {
            result->AddField(PQgetvalue(last_result_, r, c),
                             static_cast<size_t>(
                                 PQgetlength(last_result_, r, c)));
          }
        }
      }
      result->SetReturnedRows(static_cast<uint64_t>(nrows));
      result->SetSuccess(true);
      return true;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
      result->SetSuccess(true);
      return true;
    }

    const char* msg = PQresultErrorMessage(last_result_);
    last_error_ = TrimmedMessage((msg != nullptr && *msg != '\0')
                                     ? msg
                                     : PQerrorMessage(conn_));
    return false;
  }

  std::string LastError() const override { return last_error_; }

  uint64_t RowsAffected(const Result& result) override {
    if (last_result_ == nullptr || result.HasRows()) { return 0; }
    const char* tuples = PQcmdTuples(last_result_);
    if (tuples == nullptr || *tuples == '\0') { return 0; }
    return std::strtoull(tuples, nullptr, 10);
  }

  bool LastInsertId(const Result& /*result*/, int64_t* out_id) override {
    if (conn_ == nullptr) { return false; }

    PGTransactionStatusType ts = PQtransactionStatus(conn_);
    if (ts != PQTRANS_IDLE && ts != PQTRANS_INTRANS) { return false; }

    // Outside a transaction a failed read has no side effect
    bool in_transaction = (ts == PQTRANS_INTRANS);
    if (in_transaction && !Command("SAVEPOINT unidb_last_val")) {
      return false;
    }

    std::string value;
    bool ok = Scalar("SELECT lastval()", &value);

    if (in_transaction) {
      if (!ok) { Command("ROLLBACK TO SAVEPOINT unidb_last_val"); }
      Command("RELEASE SAVEPOINT unidb_last_val");
    }

    if (!ok || value.empty()) { return false; }
    *out_id = std::strtoll(value.c_str(), nullptr, 10);
    return true;
  }

  // --- Escaping ---

  std::string EscapeString(const std::string& value) override {
    std::string out(value.size() * 2 + 1, '\0');
    int error = 0;
    size_t len = PQescapeStringConn(conn_, &out[0], value.data(),
                                    value.size(), &error);
    out.resize(len);
    return "'" + out + "'";
  }

  std::string EscapeBlob(const std::string& value) override {
    size_t len = 0;
    unsigned char* escaped = PQescapeByteaConn(
        conn_, reinterpret_cast<const unsigned char*>(value.data()),
        value.size(), &len);
    if (escaped == nullptr) { return "''"; }
    // len counts the terminating NUL
    std::string out(reinterpret_cast<const char*>(escaped),
                    len > 0 ? len - 1 : 0);
    PQfreemem(escaped);
    return "'" + out + "'";
  }

  std::string UnescapeBlob(const std::string& value) override {
    size_t len = 0;
    unsigned char* raw = PQunescapeBytea(
        reinterpret_cast<const unsigned char*>(value.c_str()), &len);
    if (raw == nullptr) { return value; }
    std::string out(reinterpret_cast<const char*>(raw), len);
    PQfreemem(raw);
    return out;
  }

  PGconn* Handle() const { return conn_; }

 private:
  static void AppendParam(std::string* conninfo, const char* key,
                          const std::string& value) {
    if (value.empty()) { return; }
    if (!conninfo->empty()) { conninfo->push_back(' '); }
    conninfo->append(key);
    conninfo->append("='");
    for (char c : value) {
      if (c == '\'' || c == '\\') { conninfo->push_back('\\'); }
      conninfo->push_back(c);
    }
    conninfo->push_back('\'');
  }

  static std::string TrimmedMessage(const char* msg) {
    std::string out = (msg != nullptr) ? msg : "";
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) {
      out.pop_back();
    }
    return out;
  }

  bool Command(const char* sql) {
    PGresult* res = PQexec(conn_, sql);
    bool ok = (res != nullptr && PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return ok;
  }

  bool Scalar(const char* sql, std::string* out) {
    PGresult* res = PQexec(conn_, sql);
    bool ok = (res != nullptr && PQresultStatus(res) == PGRES_TUPLES_OK &&
               PQntuples(res) > 0 && PQnfields(res) > 0 &&
               !PQgetisnull(res, 0, 0));
    if (ok) { *out = PQgetvalue(res, 0, 0); }
    PQclear(res);
    return ok;
  }

  void ClearResult() {
    if (last_result_ != nullptr) {
      PQclear(last_result_);
      last_result_ = nullptr;
    }
  }

  PGconn* conn_ = nullptr;
  PGresult* last_result_ = nullptr;
  std::string last_error_;
};

}  // namespace unidb
