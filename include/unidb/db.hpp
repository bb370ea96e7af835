// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Database -- one connection, any of four database families.
//
// Design:
//   - Open() resolves the client library once and keeps it as a Backend
//     strategy for the connection's lifetime
//   - Query() splits multi-statement strings and returns one Result per
//     statement, in order; the first failing statement stops the run
//   - Every statement is timed; totals are logged on Close() when debug
//     is enabled
//   - Move-only, RAII, no exceptions
//
// Usage:
//   #include "unidb/db.hpp"
//   unidb::Database db;
//   unidb::Credentials creds;
//   creds.database = "app.db";
//   unidb::Error err = db.Open(unidb::Family::kSqlite, creds);
//   auto results = db.Query("CREATE TABLE t(id INTEGER PRIMARY KEY);"
//                           "INSERT INTO t DEFAULT VALUES;", &err);
//   int64_t id = results[1].GeneratedId();

#pragma once

#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "unidb/backend.hpp"
#include "unidb/credentials.hpp"
#include "unidb/error.hpp"
#include "unidb/family.hpp"
#include "unidb/logging.hpp"
#include "unidb/resolver.hpp"
#include "unidb/result.hpp"
#include "unidb/statement_splitter.hpp"
#include "unidb/translation.hpp"
#include "unidb/value_codec.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------

class Database {
 public:
  Database() = default;

  ~Database() { Close(); }

  // Move
  Database(Database&& other) noexcept
      : backend_(std::move(other.backend_)),
        translator_(std::move(other.translator_)),
        creds_(std::move(other.creds_)),
        family_(other.family_),
        debug_(other.debug_),
        query_time_(other.query_time_) {
    other.query_time_ = 0.0;
  }

  Database& operator=(Database&& other) noexcept {
    if (this != &other) {
      Close();
      backend_ = std::move(other.backend_);
      translator_ = std::move(other.translator_);
      creds_ = std::move(other.creds_);
      family_ = other.family_;
      debug_ = other.debug_;
      query_time_ = other.query_time_;
      other.query_time_ = 0.0;
    }
    return *this;
  }

  // No copy
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // --- Open / Close ---

  Error Open(Family family, const Credentials& creds) {
    if (!IsValidFamily(family)) { return InvalidFamily(); }
    return Open(family, creds, Capabilities::Detect());
  }

  /// Open with an explicit view of the host's client libraries.
  Error Open(Family family, const Credentials& creds,
             const Capabilities& caps) {
    Close();
    if (!IsValidFamily(family)) { return InvalidFamily(); }

    Error err;
    BackendKind kind = ResolveBackend(family, creds.database, caps, &err);
    if (!err.ok()) { return err; }

    std::unique_ptr<Backend> backend = MakeBackend(kind, family, &err);
    if (backend == nullptr) { return err; }

    err = backend->Connect(creds);
    if (!err.ok()) {
      Log()->error("{} [{}]: {}", FamilyLabel(family), BackendName(kind),
                   err.message);
      return err;
    }

    backend_ = std::move(backend);
    creds_ = creds;
    family_ = family;
    query_time_ = 0.0;

    for (const std::string& sql : backend_->SessionSetup()) {
      Query(sql, &err);
      if (!err.ok()) {
        Close();
        return err;
      }
    }
    return Error::Ok();
  }

  /// `family` is one of "mssql", "mysql", "postgresql", "sqlite".
  Error Open(const char* family, const Credentials& creds) {
    Family f = Family::kSqlite;
    Error err = ParseFamily(family, &f);
    if (!err.ok()) { return err; }
    return Open(f, creds);
  }

  /// DSN form: "host:port:user:password:database".
  Error Open(const char* family, const char* dsn) {
    Family f = Family::kSqlite;
    Error err = ParseFamily(family, &f);
    if (!err.ok()) { return err; }
    Credentials creds;
    err = ParseDsn(dsn, &creds);
    if (!err.ok()) { return err; }
    return Open(f, creds);
  }

  /// Release the connection. Safe to call more than once.
  void Close() {
    if (backend_ == nullptr) { return; }
    if (debug_) {
      Log()->debug("Total query time: {} seconds", query_time_);
    }
    backend_->Close();
    backend_.reset();
    translator_.reset();
  }

  bool IsOpen() const { return backend_ != nullptr && backend_->IsOpen(); }

  // --- Info ---

  void SetDebug(bool enable) {
    debug_ = enable;
    if (translator_ != nullptr) { translator_->SetDebug(enable); }
  }

  bool IsDebug() const { return debug_; }

  Family GetFamily() const { return family_; }

  BackendKind GetBackend() const {
    return backend_ ? backend_->Kind() : BackendKind::kNone;
  }

  /// Database name, or file path for SQLite.
  const std::string& GetDatabase() const { return creds_.database; }

  /// Seconds spent executing statements since Open().
  double QueryTime() const { return query_time_; }

  // --- Query ---

  /// Execute one or more ';'-separated statements. Returns one Result per
  /// statement that ran; stops at the first failure.
  std::vector<Result> Query(const char* sql, Error* out_error = nullptr) {
    std::vector<Result> results;
    if (sql == nullptr || IsBlank(sql)) {
      Report(out_error,
             Error::Make(ErrorCode::kProgrammer, "No SQL statement passed"));
      return results;
    }
    if (backend_ == nullptr) {
      Report(out_error, Error::Make(ErrorCode::kNotOpen, "Database not open"));
      return results;
    }

    std::vector<std::string> statements = SplitStatements(sql);
    if (statements.empty()) {
      Report(out_error,
             Error::Make(ErrorCode::kProgrammer, "No SQL statement passed"));
      return results;
    }

    results.reserve(statements.size());
    for (std::string& statement : statements) {
      Result result(std::move(statement));
      Error err;
      if (!Execute(&result, &err)) {
        Report(out_error, err);
        return results;
      }
      results.push_back(std::move(result));
    }
    Report(out_error, Error::Ok());
    return results;
  }

  std::vector<Result> Query(const std::string& sql,
                            Error* out_error = nullptr) {
    return Query(sql.c_str(), out_error);
  }

  /// Rewrite `sql` for this backend's dialect, then Query() it.
  std::vector<Result> TranslatedQuery(const std::string& sql,
                                      Error* out_error = nullptr) {
    if (backend_ == nullptr) {
      Report(out_error, Error::Make(ErrorCode::kNotOpen, "Database not open"));
      return {};
    }
    if (translator_ == nullptr) {
      translator_.reset(new DialectTranslator(family_, backend_->Kind()));
      translator_->SetDebug(debug_);
    }
    return Query(translator_->Translate(sql), out_error);
  }

  void SetTranslator(std::unique_ptr<SqlTranslator> translator) {
    translator_ = std::move(translator);
    if (translator_ != nullptr) { translator_->SetDebug(debug_); }
  }

  // --- Escaping ---

  std::string EscapeString(const std::string& value,
                           Error* out_error = nullptr) {
    if (!RequireOpen(out_error)) { return std::string(); }
    return backend_->EscapeString(value);
  }

  std::string UnescapeString(const std::string& value) const { return value; }

  std::string EscapeBlob(const std::string& value,
                         Error* out_error = nullptr) {
    if (!RequireOpen(out_error)) { return std::string(); }
    return backend_->EscapeBlob(value);
  }

  std::string UnescapeBlob(const std::string& value,
                           Error* out_error = nullptr) {
    if (!RequireOpen(out_error)) { return std::string(); }
    return backend_->UnescapeBlob(value);
  }

  std::string EscapeBoolean(bool value) const {
    return BooleanLiteral(family_, value);
  }

  bool UnescapeBoolean(const char* value) const {
    return ParseBoolean(value);
  }

  std::string EscapeTimestamp(const std::string& value,
                              Error* out_error = nullptr) const {
    DateTime dt;
    if (!ParseValue(value, "timestamp", &dt, out_error)) {
      return std::string();
    }
    return "'" + FormatTimestamp(dt) + "'";
  }

  std::string UnescapeTimestamp(const std::string& value,
                                Error* out_error = nullptr) const {
    DateTime dt;
    if (!ParseValue(value, "timestamp", &dt, out_error)) {
      return std::string();
    }
    return FormatTimestamp(dt);
  }

  std::string EscapeDate(const std::string& value,
                         Error* out_error = nullptr) const {
    DateTime dt;
    if (!ParseValue(value, "date", &dt, out_error)) { return std::string(); }
    return "'" + FormatDate(dt) + "'";
  }

  std::string UnescapeDate(const std::string& value,
                           Error* out_error = nullptr) const {
    DateTime dt;
    if (!ParseValue(value, "date", &dt, out_error)) { return std::string(); }
    return FormatDate(dt);
  }

  std::string EscapeTime(const std::string& value,
                         Error* out_error = nullptr) const {
    DateTime dt;
    if (!ParseValue(value, "time", &dt, out_error)) { return std::string(); }
    return "'" + FormatTime(dt) + "'";
  }

  std::string UnescapeTime(const std::string& value,
                           Error* out_error = nullptr) const {
    DateTime dt;
    if (!ParseValue(value, "time", &dt, out_error)) { return std::string(); }
    return FormatTime(dt);
  }

  /// Escape by element name: string, blob, boolean, timestamp, date, time.
  std::string Escape(const char* element, const std::string& value,
                     Error* out_error = nullptr) {
    const char* e = (element != nullptr) ? element : "";
    if (std::strcmp(e, "string") == 0) {
      return EscapeString(value, out_error);
    }
    if (std::strcmp(e, "blob") == 0) { return EscapeBlob(value, out_error); }
    if (std::strcmp(e, "boolean") == 0) {
      Report(out_error, Error::Ok());
      return EscapeBoolean(ParseBoolean(value.c_str()));
    }
    if (std::strcmp(e, "timestamp") == 0) {
      return EscapeTimestamp(value, out_error);
    }
    if (std::strcmp(e, "date") == 0) { return EscapeDate(value, out_error); }
    if (std::strcmp(e, "time") == 0) { return EscapeTime(value, out_error); }
    Report(out_error, InvalidElement(e));
    return std::string();
  }

  /// Inverse of Escape(). Booleans come back as "1" or "0".
  std::string Unescape(const char* element, const std::string& value,
                       Error* out_error = nullptr) {
    const char* e = (element != nullptr) ? element : "";
    if (std::strcmp(e, "string") == 0) {
      Report(out_error, Error::Ok());
      return UnescapeString(value);
    }
    if (std::strcmp(e, "blob") == 0) {
      return UnescapeBlob(value, out_error);
    }
    if (std::strcmp(e, "boolean") == 0) {
      Report(out_error, Error::Ok());
      return UnescapeBoolean(value.c_str()) ? "1" : "0";
    }
    if (std::strcmp(e, "timestamp") == 0) {
      return UnescapeTimestamp(value, out_error);
    }
    if (std::strcmp(e, "date") == 0) {
      return UnescapeDate(value, out_error);
    }
    if (std::strcmp(e, "time") == 0) {
      return UnescapeTime(value, out_error);
    }
    Report(out_error, InvalidElement(e));
    return std::string();
  }

  /// Access the active backend (nullptr when closed).
  Backend* Impl() { return backend_.get(); }

 private:
  static Error InvalidFamily() {
    return Error::Make(ErrorCode::kProgrammer,
                       "Invalid database type specified");
  }

  static Error InvalidElement(const char* element) {
    Error err;
    err.SetFormat(ErrorCode::kProgrammer,
                  "Invalid element '%s' (expected string, blob, boolean, "
                  "timestamp, date or time)", element);
    return err;
  }

  static bool IsBlank(const char* sql) {
    for (const char* p = sql; *p != '\0'; ++p) {
      if (!splitter_detail::IsSpace(*p)) { return false; }
    }
    return true;
  }

  static bool ParseValue(const std::string& value, const char* what,
                         DateTime* dt, Error* out_error) {
    if (!ParseDateTime(value, dt)) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kProgrammer,
                             "Unable to parse %s value '%s'", what,
                             value.c_str());
      }
      return false;
    }
    Report(out_error, Error::Ok());
    return true;
  }

  bool RequireOpen(Error* out_error) const {
    if (backend_ == nullptr) {
      Report(out_error, Error::Make(ErrorCode::kNotOpen, "Database not open"));
      return false;
    }
    Report(out_error, Error::Ok());
    return true;
  }

  bool Execute(Result* result, Error* err) {
    auto start = std::chrono::steady_clock::now();
    bool ok = backend_->Execute(result);
    double elapsed = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - start).count();
    query_time_ += elapsed;
    if (debug_) {
      Log()->debug("Query time was {} seconds for:\n{}", elapsed,
                   result->Sql());
    }

    if (!ok) {
      result->SetSuccess(false);
      err->SetFormat(ErrorCode::kSql, "%s error [%s] (%s) in %s",
                     FamilyLabel(family_), BackendName(backend_->Kind()),
                     backend_->LastError().c_str(), result->Sql().c_str());
      return false;
    }

    result->SetAffectedRows(backend_->RowsAffected(*result));
    if (IsInsertStatement(result->Sql())) {
      int64_t id = 0;
      if (backend_->LastInsertId(*result, &id)) { result->SetGeneratedId(id); }
    }
    return true;
  }

  std::unique_ptr<Backend> backend_;
  std::unique_ptr<SqlTranslator> translator_;
  Credentials creds_;
  Family family_ = Family::kSqlite;
  bool debug_ = false;
  double query_time_ = 0.0;
};

}  // namespace unidb
