// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::MariaBackend -- MySQL family through the MariaDB/MySQL C API.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Results are fetched with mysql_store_result() and copied out with
//     their lengths, so binary columns survive
//   - Session runs in ANSI, strict mode
//   - Requires UNIDB_HAS_MARIADB=1

#pragma once

#include <cstdint>
#include <string>

#include <mysql.h>

#include "unidb/backend.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// MariaBackend
// ---------------------------------------------------------------------------

class MariaBackend : public Backend {
 public:
  MariaBackend() : Backend(Family::kMysql) {}
  ~MariaBackend() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kMysql; }

  // --- Open / Close ---

  Error Connect(const Credentials& creds) override {
    Close();

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kConnectivity, "mysql_init failed");
    }

    const char* host = creds.host.empty() ? nullptr : creds.host.c_str();
    const char* user =
        creds.username.empty() ? nullptr : creds.username.c_str();
    const char* password =
        creds.password.empty() ? nullptr : creds.password.c_str();
    const char* database =
        creds.database.empty() ? nullptr : creds.database.c_str();

    // Port 0 lets the client library pick its own default
    if (mysql_real_connect(conn_, host, user, password, database,
                           creds.port, nullptr, 0) == nullptr) {
      Error err;
      err.SetFormat(ErrorCode::kConnectivity,
                    "Unable to connect to database '%s': %s",
                    creds.database.c_str(), mysql_error(conn_));
      mysql_close(conn_);
      conn_ = nullptr;
      return err;
    }

    mysql_set_character_set(conn_, "utf8mb4");
    return Error::Ok();
  }

  void Close() override {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
  }

  bool IsOpen() const override { return conn_ != nullptr; }

  std::vector<std::string> SessionSetup() const override {
    return {"SET sql_mode = 'ANSI,STRICT_ALL_TABLES'"};
  }

  // --- Execution ---

  bool Execute(Result* result) override {
    last_error_.clear();
    if (conn_ == nullptr) {
      last_error_ = "Database not open";
      return false;
    }

    const std::string& sql = result->Sql();
    if (mysql_real_query(conn_, sql.c_str(),
                         static_cast<unsigned long>(sql.size())) != 0) {
      last_error_ = mysql_error(conn_);
      return false;
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res == nullptr) {
      // No result set is fine for a non-SELECT, an error otherwise
      if (mysql_field_count(conn_) > 0) {
        last_error_ = mysql_error(conn_);
        return false;
      }
      result->SetSuccess(true);
      return true;
    }

    uint32_t num_cols = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);
    for (uint32_t i = 0; i < num_cols; ++i) {
      result->AddColumn(fields[i].name);
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
      unsigned long* lengths = mysql_fetch_lengths(res);
      result->BeginRow();
      for (uint32_t i = 0; i < num_cols; ++i) {
        if (row[i] == nullptr) {
          result->AddNull();
        } else {
          result->AddField(row[i], lengths[i]);
        }
      }
    }

    result->SetReturnedRows(static_cast<uint64_t>(mysql_num_rows(res)));
    mysql_free_result(res);
    result->SetSuccess(true);
    return true;
  }

  std::string LastError() const override { return last_error_; }

  uint64_t RowsAffected(const Result& result) override {
    if (conn_ == nullptr || result.HasRows()) { return 0; }
    my_ulonglong affected = mysql_affected_rows(conn_);
    if (affected == static_cast<my_ulonglong>(-1)) { return 0; }
    return static_cast<uint64_t>(affected);
  }

  bool LastInsertId(const Result& /*result*/, int64_t* out_id) override {
    if (conn_ == nullptr) { return false; }
    my_ulonglong id = mysql_insert_id(conn_);
    if (id == 0) { return false; }
    *out_id = static_cast<int64_t>(id);
    return true;
  }

  // --- Escaping ---

  std::string EscapeString(const std::string& value) override {
    return "'" + RealEscape(value) + "'";
  }

  std::string EscapeBlob(const std::string& value) override {
    return "'" + RealEscape(value) + "'";
  }

  MYSQL* Handle() const { return conn_; }

 private:
  std::string RealEscape(const std::string& value) {
    std::string out(value.size() * 2 + 1, '\0');
    unsigned long len = mysql_real_escape_string(
        conn_, &out[0], value.data(),
        static_cast<unsigned long>(value.size()));
    out.resize(len);
    return out;
  }

  MYSQL* conn_ = nullptr;
  std::string last_error_;
};

}  // namespace unidb
