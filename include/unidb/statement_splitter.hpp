// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::SplitStatements -- split a multi-statement SQL string.
//
// Rules:
//   - Only ';' outside literals, quoted identifiers and comments separates
//     statements. Single-quoted literals may contain '' and backslash
//     escapes; "..", `..`, [..], $tag$..$tag$, -- and /* */ are skipped.
//   - CREATE TRIGGER/PROCEDURE/FUNCTION/EVENT bodies are kept whole:
//     BEGIN and CASE at parenthesis depth 0 open a block, END closes it.
//     END IF/LOOP/WHILE/REPEAT close their own construct and are not
//     counted.
//   - "...; END" is one statement: a ';' followed by a bare END keyword
//     (then ';' or end of input) is not a separator.
//   - Statements are trimmed, blank ones are dropped.
//   - A string without ';' is returned unchanged.

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace unidb {

namespace splitter_detail {

inline bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

inline std::string Upper(const std::string& s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

inline std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && IsSpace(s[b])) { ++b; }
  while (e > b && IsSpace(s[e - 1])) { --e; }
  return s.substr(b, e - b);
}

/// Index one past the literal starting at `pos` (which holds the quote).
/// An unterminated literal runs to the end of the input.
inline size_t SkipLiteral(const std::string& sql, size_t pos) {
  size_t i = pos + 1;
  while (i < sql.size()) {
    char c = sql[i];
    if (c == '\\' && i + 1 < sql.size()) {
      i += 2;
    } else if (c == '\'' && i + 1 < sql.size() && sql[i + 1] == '\'') {
      i += 2;
    } else if (c == '\'') {
      return i + 1;
    } else {
      ++i;
    }
  }
  return sql.size();
}

/// Quoted identifier ending at `close`, a doubled `close` is literal.
inline size_t SkipIdentifier(const std::string& sql, size_t pos, char close) {
  size_t i = pos + 1;
  while (i < sql.size()) {
    if (sql[i] == close) {
      if (i + 1 < sql.size() && sql[i + 1] == close) {
        i += 2;
        continue;
      }
      return i + 1;
    }
    ++i;
  }
  return sql.size();
}

/// PostgreSQL $tag$...$tag$ body. Returns `pos` when no tag starts here.
inline size_t SkipDollarQuote(const std::string& sql, size_t pos) {
  if (pos > 0 && IsWordChar(sql[pos - 1])) { return pos; }
  size_t i = pos + 1;
  if (i < sql.size() && std::isdigit(static_cast<unsigned char>(sql[i]))) {
    return pos;
  }
  while (i < sql.size() && IsWordChar(sql[i])) { ++i; }
  if (i >= sql.size() || sql[i] != '$') { return pos; }
  std::string tag = sql.substr(pos, i - pos + 1);
  size_t close = sql.find(tag, i + 1);
  return (close == std::string::npos) ? sql.size() : close + tag.size();
}

/// Index one past the literal, quoted identifier or comment starting at
/// `pos`, or `pos` itself when ordinary SQL text starts there.
inline size_t SkipNonCode(const std::string& sql, size_t pos) {
  char c = sql[pos];
  char next = (pos + 1 < sql.size()) ? sql[pos + 1] : '\0';
  switch (c) {
    case '\'': return SkipLiteral(sql, pos);
    case '"':  return SkipIdentifier(sql, pos, '"');
    case '`':  return SkipIdentifier(sql, pos, '`');
    case '[':  return SkipIdentifier(sql, pos, ']');
    case '$':  return SkipDollarQuote(sql, pos);
    case '-':
      if (next != '-') { return pos; }
      {
        size_t eol = sql.find('\n', pos);
        return (eol == std::string::npos) ? sql.size() : eol + 1;
      }
    case '/':
      if (next != '*') { return pos; }
      {
        size_t close = sql.find("*/", pos + 2);
        return (close == std::string::npos) ? sql.size() : close + 2;
      }
    default:
      return pos;
  }
}

/// Upper-cased word starting at the first non-space at or after `pos`.
inline std::string NextWord(const std::string& sql, size_t pos) {
  while (pos < sql.size() && IsSpace(sql[pos])) { ++pos; }
  size_t end = pos;
  while (end < sql.size() && IsWordChar(sql[end])) { ++end; }
  return Upper(sql.substr(pos, end - pos));
}

/// True when the text after a ';' at `pos` is a bare END keyword followed
/// by ';' or the end of input. `end_pos` receives the index after END.
inline bool FollowedByEnd(const std::string& sql, size_t pos,
                          size_t* end_pos) {
  size_t i = pos + 1;
  while (i < sql.size() && IsSpace(sql[i])) { ++i; }
  if (i + 3 > sql.size() || Upper(sql.substr(i, 3)) != "END") {
    return false;
  }
  size_t after = i + 3;
  if (after < sql.size() && IsWordChar(sql[after])) { return false; }
  size_t j = after;
  while (j < sql.size() && IsSpace(sql[j])) { ++j; }
  if (j < sql.size() && sql[j] != ';') { return false; }
  *end_pos = after;
  return true;
}

inline void Flush(std::string* cur, std::vector<std::string>* out) {
  std::string stmt = Trim(*cur);
  if (!stmt.empty()) { out->push_back(stmt); }
  cur->clear();
}

}  // namespace splitter_detail

// ---------------------------------------------------------------------------
// SplitStatements
// ---------------------------------------------------------------------------

inline std::vector<std::string> SplitStatements(const std::string& sql) {
  using namespace splitter_detail;

  if (sql.find(';') == std::string::npos) { return {sql}; }

  std::vector<std::string> out;
  std::string cur;
  bool first_word_seen = false;
  bool create = false;    // statement starts with CREATE
  bool compound = false;  // ... TRIGGER/PROCEDURE/FUNCTION/EVENT
  int32_t parens = 0;
  int32_t depth = 0;

  size_t i = 0;
  while (i < sql.size()) {
    char c = sql[i];

    size_t skipped = SkipNonCode(sql, i);
    if (skipped != i) {
      cur.append(sql, i, skipped - i);
      i = skipped;
      continue;
    }

    if (IsWordChar(c)) {
      size_t end = i;
      while (end < sql.size() && IsWordChar(sql[end])) { ++end; }
      std::string word = Upper(sql.substr(i, end - i));
      bool qualified = i > 0 && sql[i - 1] == '.';
      cur.append(sql, i, end - i);
      i = end;

      if (!first_word_seen) {
        first_word_seen = true;
        create = (word == "CREATE");
      } else if (create && !compound) {
        if (word == "TRIGGER" || word == "PROCEDURE" || word == "FUNCTION" ||
            word == "EVENT") {
          compound = true;
        } else if (word == "TABLE" || word == "INDEX" || word == "VIEW" ||
                   word == "SEQUENCE" || word == "SCHEMA" ||
                   word == "DATABASE" || word == "TYPE") {
          create = false;
        }
      } else if (compound && parens == 0 && !qualified) {
        if (word == "BEGIN" || word == "CASE") {
          ++depth;
        } else if (word == "END" && depth > 0) {
          std::string closes = NextWord(sql, i);
          bool loop = closes == "IF" || closes == "LOOP" ||
                      closes == "WHILE" || closes == "REPEAT";
          if (loop || closes == "CASE") {
            // Consume the closing keyword so END CASE does not reopen
            size_t after = i;
            while (IsSpace(sql[after])) { ++after; }
            after += closes.size();
            cur.append(sql, i, after - i);
            i = after;
          }
          if (!loop) { --depth; }
        }
      }
      continue;
    }

    if (c == '(') {
      ++parens;
    } else if (c == ')' && parens > 0) {
      --parens;
    }

    if (c == ';') {
      size_t end_pos = 0;
      if (depth > 0) {
        cur.push_back(c);
        ++i;
      } else if (FollowedByEnd(sql, i, &end_pos)) {
        cur.append(sql, i, end_pos - i);
        i = end_pos;
      } else {
        Flush(&cur, &out);
        first_word_seen = false;
        create = false;
        compound = false;
        parens = 0;
        depth = 0;
        ++i;
      }
      continue;
    }

    cur.push_back(c);
    ++i;
  }
  Flush(&cur, &out);
  return out;
}

// ---------------------------------------------------------------------------
// IsInsertStatement
// ---------------------------------------------------------------------------

/// True for INSERT (and MySQL/SQLite REPLACE) statements.
inline bool IsInsertStatement(const std::string& sql) {
  using namespace splitter_detail;
  size_t i = 0;
  while (i < sql.size() && (IsSpace(sql[i]) || sql[i] == '(')) { ++i; }
  size_t end = i;
  while (end < sql.size() && IsWordChar(sql[end])) { ++end; }
  std::string word = Upper(sql.substr(i, end - i));
  return word == "INSERT" || word == "REPLACE";
}

}  // namespace unidb
