// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Backend -- capability interface implemented once per client library.
//
// Design:
//   - Selected once by the resolver, owned by Database for its lifetime
//   - Execute() never propagates a native failure: it returns false and
//     keeps the library's message for LastError()
//   - Each implementation owns exactly one native handle (RAII, move-less)

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "unidb/credentials.hpp"
#include "unidb/error.hpp"
#include "unidb/family.hpp"
#include "unidb/result.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// Backend
// ---------------------------------------------------------------------------

class Backend {
 public:
  explicit Backend(Family family) : family_(family) {}
  virtual ~Backend() = default;

  Backend(const Backend&) = delete;
  Backend& operator=(const Backend&) = delete;

  Family GetFamily() const { return family_; }
  virtual BackendKind Kind() const = 0;

  // --- Connection ---

  /// Open the native handle. Any failure is reported as kConnectivity and
  /// leaves the backend closed.
  virtual Error Connect(const Credentials& creds) = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  /// Statements run through the normal query path right after Connect().
  virtual std::vector<std::string> SessionSetup() const { return {}; }

  // --- Execution ---

  /// Run result->Sql(). Fills rows, ReturnedRows() and Success().
  /// Returns false when the library reported a failure.
  virtual bool Execute(Result* result) = 0;

  /// Native message describing the last failed Execute().
  virtual std::string LastError() const = 0;

  /// Rows changed by the statement that produced `result`.
  virtual uint64_t RowsAffected(const Result& result) = 0;

  /// Value generated by an auto-increment/identity/sequence for the last
  /// insert. Returns false when there is none; never fails otherwise.
  virtual bool LastInsertId(const Result& result, int64_t* out_id) = 0;

  // --- Value escaping ---

  /// Quoted string literal.
  virtual std::string EscapeString(const std::string& value) = 0;

  /// Binary-safe literal, quoted when the syntax needs it.
  virtual std::string EscapeBlob(const std::string& value) = 0;

  virtual std::string UnescapeBlob(const std::string& value) {
    return value;
  }

 protected:
  /// "'" + value with every ' doubled + "'".
  static std::string QuoteDoubling(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
      if (c == '\'') { out.push_back('\''); }
      out.push_back(c);
    }
    out.push_back('\'');
    return out;
  }

  /// Lower case hex of every byte.
  static std::string HexEncode(const std::string& value) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(value.size() * 2);
    for (char c : value) {
      unsigned char b = static_cast<unsigned char>(c);
      out.push_back(kDigits[b >> 4]);
      out.push_back(kDigits[b & 0x0F]);
    }
    return out;
  }

 private:
  Family family_;
};

}  // namespace unidb
