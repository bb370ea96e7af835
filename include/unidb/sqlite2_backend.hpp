// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Sqlite2Backend -- legacy SQLite 2.1 files through libsqlite 2.x.
//
// Design:
//   - Wraps the v2 `sqlite*` handle with RAII
//   - Execute() loads the whole result with sqlite_get_table()
//   - Session setup asks for short column names so rows are keyed the same
//     way as on the other backends
//   - Requires UNIDB_HAS_SQLITE2=1

#pragma once

#include <cstdint>
#include <string>

#include <sqlite.h>

#include "unidb/backend.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// Sqlite2Backend
// ---------------------------------------------------------------------------

class Sqlite2Backend : public Backend {
 public:
  Sqlite2Backend() : Backend(Family::kSqlite) {}
  ~Sqlite2Backend() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kSqlite2; }

  Error Connect(const Credentials& creds) override {
    Close();
    char* errmsg = nullptr;
    db_ = sqlite_open(creds.database.c_str(), 0666, &errmsg);
    if (db_ == nullptr) {
      Error err;
      err.SetFormat(ErrorCode::kConnectivity,
                    "Unable to connect to database '%s': %s",
                    creds.database.c_str(),
                    errmsg ? errmsg : "sqlite_open failed");
      if (errmsg != nullptr) { sqlite_freemem(errmsg); }
      return err;
    }
    return Error::Ok();
  }

  void Close() override {
    if (db_ != nullptr) {
      sqlite_close(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const override { return db_ != nullptr; }

  std::vector<std::string> SessionSetup() const override {
    return {"PRAGMA short_column_names = 1"};
  }

  bool Execute(Result* result) override {
    last_error_.clear();
    if (db_ == nullptr) {
      last_error_ = "Database not open";
      return false;
    }

    char** table = nullptr;
    char* errmsg = nullptr;
    int rows = 0;
    int cols = 0;
    int rc = sqlite_get_table(db_, result->Sql().c_str(), &table, &rows,
                              &cols, &errmsg);
    if (rc != SQLITE_OK) {
      last_error_ = errmsg ? errmsg : "sqlite_get_table failed";
      if (errmsg != nullptr) { sqlite_freemem(errmsg); }
      if (table != nullptr) { sqlite_free_table(table); }
      return false;
    }

    if (table != nullptr) {
      for (int c = 0; c < cols; ++c) { result->AddColumn(table[c]); }
      for (int r = 1; r <= rows; ++r) {
        result->BeginRow();
        for (int c = 0; c < cols; ++c) {
          result->AddField(table[r * cols + c]);
        }
      }
      sqlite_free_table(table);
    }

    result->SetReturnedRows(result->NumRows());
    result->SetSuccess(true);
    return true;
  }

  std::string LastError() const override { return last_error_; }

  uint64_t RowsAffected(const Result& result) override {
    if (db_ == nullptr || result.HasRows()) { return 0; }
    return static_cast<uint64_t>(sqlite_changes(db_));
  }

  bool LastInsertId(const Result& /*result*/, int64_t* out_id) override {
    if (db_ == nullptr) { return false; }
    int id = sqlite_last_insert_rowid(db_);
    if (id == 0) { return false; }
    *out_id = id;
    return true;
  }

  std::string EscapeString(const std::string& value) override {
    char* quoted = sqlite_mprintf("'%q'", value.c_str());
    if (quoted == nullptr) { return QuoteDoubling(value); }
    std::string out(quoted);
    sqlite_freemem(quoted);
    return out;
  }

  std::string EscapeBlob(const std::string& value) override {
    return "X'" + HexEncode(value) + "'";
  }

 private:
  sqlite* db_ = nullptr;
  std::string last_error_;
};

}  // namespace unidb
