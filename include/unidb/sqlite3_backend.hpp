// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Sqlite3Backend -- SQLite 3 files through libsqlite3.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Execute() steps the statement to completion and materializes rows
//   - Affected rows come from sqlite3_changes(), guarded by the
//     total_changes delta so DDL and SELECT report 0

#pragma once

#include <cstdint>
#include <string>

#include "sqlite3.h"

#include "unidb/backend.hpp"
#include "unidb/logging.hpp"
#include "unidb/statement_splitter.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// Sqlite3Backend
// ---------------------------------------------------------------------------

class Sqlite3Backend : public Backend {
 public:
  Sqlite3Backend() : Backend(Family::kSqlite) {}
  ~Sqlite3Backend() override { Close(); }

  BackendKind Kind() const override { return BackendKind::kSqlite3; }

  // --- Open / Close ---

  Error Connect(const Credentials& creds) override {
    Close();
    int32_t rc = sqlite3_open_v2(creds.database.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                 nullptr);
    if (rc != SQLITE_OK) {
      Error err;
      err.SetFormat(ErrorCode::kConnectivity,
                    "Unable to connect to database '%s': %s",
                    creds.database.c_str(),
                    db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    return Error::Ok();
  }

  void Close() override {
    if (db_ != nullptr) {
      if (sqlite3_close(db_) != SQLITE_OK) {
        Log()->warn("sqlite3_close: {}", sqlite3_errmsg(db_));
        sqlite3_close_v2(db_);
      }
      db_ = nullptr;
    }
  }

  bool IsOpen() const override { return db_ != nullptr; }

  // --- Execution ---

  bool Execute(Result* result) override {
    last_error_.clear();
    changed_ = false;
    if (db_ == nullptr) {
      last_error_ = "Database not open";
      return false;
    }

    int32_t changes_before = sqlite3_total_changes(db_);

    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, result->Sql().c_str(), -1, &stmt,
                                    &tail);
    if (rc != SQLITE_OK) {
      last_error_ = sqlite3_errmsg(db_);
      return false;
    }
    // Exactly one statement per call
    if (tail != nullptr && !IsBlankTail(tail)) {
      last_error_ = std::string("unexpected text after statement: ") + tail;
      sqlite3_finalize(stmt);
      return false;
    }
    if (stmt == nullptr) {
      // Whitespace or comment only
      result->SetSuccess(true);
      return true;
    }

    int32_t num_cols = sqlite3_column_count(stmt);
    for (int32_t i = 0; i < num_cols; ++i) {
      result->AddColumn(sqlite3_column_name(stmt, i));
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
      result->BeginRow();
      for (int32_t i = 0; i < num_cols; ++i) {
        int32_t type = sqlite3_column_type(stmt, i);
        if (type == SQLITE_NULL) {
          result->AddNull();
        } else if (type == SQLITE_BLOB) {
          const void* data = sqlite3_column_blob(stmt, i);
          int32_t len = sqlite3_column_bytes(stmt, i);
          result->AddField(static_cast<const char*>(data),
                           static_cast<size_t>(len));
        } else {
          const unsigned char* text = sqlite3_column_text(stmt, i);
          int32_t len = sqlite3_column_bytes(stmt, i);
          result->AddField(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(len));
        }
      }
    }

    if (rc != SQLITE_DONE) {
      last_error_ = sqlite3_errmsg(db_);
      sqlite3_finalize(stmt);
      return false;
    }
    sqlite3_finalize(stmt);

    changed_ = (num_cols == 0) &&
               (sqlite3_total_changes(db_) != changes_before);
    result->SetReturnedRows(result->NumRows());
    result->SetSuccess(true);
    return true;
  }

  std::string LastError() const override { return last_error_; }

  uint64_t RowsAffected(const Result& result) override {
    if (db_ == nullptr || result.HasRows() || !changed_) { return 0; }
    return static_cast<uint64_t>(sqlite3_changes(db_));
  }

  bool LastInsertId(const Result& /*result*/, int64_t* out_id) override {
    if (db_ == nullptr || !changed_) { return false; }
    int64_t id = static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
    if (id == 0) { return false; }
    *out_id = id;
    return true;
  }

  // --- Escaping ---

  std::string EscapeString(const std::string& value) override {
    char* quoted = sqlite3_mprintf("%Q", value.c_str());
    if (quoted == nullptr) { return QuoteDoubling(value); }
    std::string out(quoted);
    sqlite3_free(quoted);
    return out;
  }

  std::string EscapeBlob(const std::string& value) override {
    return "X'" + HexEncode(value) + "'";
  }

  sqlite3* Handle() const { return db_; }

 private:
  // Whitespace, comments and stray ';' only
  static bool IsBlankTail(const char* tail) {
    std::string rest(tail);
    size_t i = 0;
    while (i < rest.size()) {
      size_t next = splitter_detail::SkipNonCode(rest, i);
      bool comment = next != i && (rest[i] == '-' || rest[i] == '/');
      if (comment) {
        i = next;
      } else if (splitter_detail::IsSpace(rest[i]) || rest[i] == ';') {
        ++i;
      } else {
        return false;
      }
    }
    return true;
  }

  sqlite3* db_ = nullptr;
  std::string last_error_;
  bool changed_ = false;
};

}  // namespace unidb
