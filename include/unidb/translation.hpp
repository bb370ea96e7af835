// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::SqlTranslator -- rewrites portable SQL into a backend's dialect.
//
// Design:
//   - Interface so applications can plug in a full translation layer
//   - DialectTranslator covers the literal and function spellings that
//     differ between the four families; literals, quoted names and
//     comments are skipped with the statement splitter's scanner

#pragma once

#include <string>

#include "unidb/family.hpp"
#include "unidb/logging.hpp"
#include "unidb/statement_splitter.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// SqlTranslator
// ---------------------------------------------------------------------------

class SqlTranslator {
 public:
  virtual ~SqlTranslator() = default;
  virtual std::string Translate(const std::string& sql) = 0;
  virtual void SetDebug(bool enable) { debug_ = enable; }
  bool IsDebug() const { return debug_; }

 private:
  bool debug_ = false;
};

// ---------------------------------------------------------------------------
// DialectTranslator
// ---------------------------------------------------------------------------

class DialectTranslator : public SqlTranslator {
 public:
  DialectTranslator(Family family, BackendKind backend)
      : family_(family), backend_(backend) {}

  std::string Translate(const std::string& sql) override {
    std::string out;
    out.reserve(sql.size());

    size_t i = 0;
    while (i < sql.size()) {
      char c = sql[i];
      size_t skipped = splitter_detail::SkipNonCode(sql, i);
      if (skipped != i) {
        out.append(sql, i, skipped - i);
        i = skipped;
        continue;
      }
      if (splitter_detail::IsWordChar(c)) {
        size_t end = i;
        while (end < sql.size() && splitter_detail::IsWordChar(sql[end])) {
          ++end;
        }
        std::string word = sql.substr(i, end - i);
        out += Rewrite(word, sql, end);
        i = end;
        continue;
      }
      out.push_back(c);
      ++i;
    }

    if (IsDebug() && out != sql) {
      Log()->debug("Translated SQL for {} ({}):\n{}\n=>\n{}",
                   FamilyName(family_), BackendName(backend_), sql, out);
    }
    return out;
  }

 private:
  // `next` is the index after the word, used to spot function calls
  std::string Rewrite(const std::string& word, const std::string& sql,
                      size_t next) const {
    std::string upper = splitter_detail::Upper(word);
    bool call = next < sql.size() && sql[next] == '(';

    if (family_ == Family::kMssql || family_ == Family::kSqlite) {
      if (upper == "TRUE") { return "'1'"; }
      if (upper == "FALSE") { return "'0'"; }
    }
    if (family_ == Family::kMssql && call && upper == "LENGTH") {
      return "LEN";
    }
    if ((family_ == Family::kMssql || family_ == Family::kMysql) && call &&
        upper == "RANDOM") {
      return "RAND";
    }
    return word;
  }

  Family family_;
  BackendKind backend_;
};

}  // namespace unidb
