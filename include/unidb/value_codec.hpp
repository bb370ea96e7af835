// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb value codec -- backend-independent literal conversions.
//
// Design:
//   - Date/time values are parsed leniently and rendered in the canonical
//     forms every family accepts: YYYY-MM-DD HH:MM:SS, YYYY-MM-DD, HH:MM:SS
//   - Zone suffixes are accepted and ignored (wall clock is kept)
//   - Booleans follow each family's literal syntax
//   - String and blob quoting lives in the backends

#pragma once

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>

#include "unidb/family.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// DateTime
// ---------------------------------------------------------------------------

struct DateTime {
  int32_t year = 1970;
  int32_t month = 1;
  int32_t day = 1;
  int32_t hour = 0;
  int32_t minute = 0;
  int32_t second = 0;
};

namespace codec_detail {

inline std::string Lower(const std::string& s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

inline std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) { ++b; }
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) { --e; }
  return s.substr(b, e - b);
}

/// Drops one pair of surrounding single quotes.
inline std::string Unquote(const std::string& s) {
  if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

inline DateTime FromTm(const std::tm& tm) {
  DateTime dt;
  dt.year = tm.tm_year + 1900;
  dt.month = tm.tm_mon + 1;
  dt.day = tm.tm_mday;
  dt.hour = tm.tm_hour;
  dt.minute = tm.tm_min;
  dt.second = tm.tm_sec;
  return dt;
}

/// False when `t` does not fit a broken-down local time.
inline bool LocalTime(std::time_t t, DateTime* out) {
  std::tm tm = {};
  if (localtime_r(&t, &tm) == nullptr) { return false; }
  *out = FromTm(tm);
  return true;
}

/// Midnight of today shifted by `days`.
inline bool LocalDay(int32_t days, DateTime* out) {
  std::time_t now = std::time(nullptr);
  std::tm tm = {};
  if (localtime_r(&now, &tm) == nullptr) { return false; }
  tm.tm_mday += days;
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  if (std::mktime(&tm) == static_cast<std::time_t>(-1)) { return false; }
  *out = FromTm(tm);
  return true;
}

inline bool IsLeap(int32_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline int32_t DaysInMonth(int32_t y, int32_t m) {
  static const int32_t kDays[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
  if (m == 2 && IsLeap(y)) { return 29; }
  return kDays[m - 1];
}

inline bool Valid(const DateTime& dt) {
  if (dt.year < 1 || dt.year > 9999) { return false; }
  if (dt.month < 1 || dt.month > 12) { return false; }
  if (dt.day < 1 || dt.day > DaysInMonth(dt.year, dt.month)) { return false; }
  if (dt.hour < 0 || dt.hour > 23) { return false; }
  if (dt.minute < 0 || dt.minute > 59) { return false; }
  return dt.second >= 0 && dt.second <= 60;
}

/// Reads 1..max_digits decimal digits at `*pos`.
inline bool ReadInt(const std::string& s, size_t* pos, int32_t max_digits,
                    int32_t* out) {
  size_t i = *pos;
  int32_t value = 0;
  int32_t n = 0;
  while (i < s.size() && n < max_digits &&
         std::isdigit(static_cast<unsigned char>(s[i]))) {
    value = value * 10 + (s[i] - '0');
    ++i;
    ++n;
  }
  if (n == 0) { return false; }
  *pos = i;
  *out = value;
  return true;
}

inline bool Expect(const std::string& s, size_t* pos, char c) {
  if (*pos < s.size() && s[*pos] == c) {
    ++*pos;
    return true;
  }
  return false;
}

inline int32_t MonthFromName(const std::string& word) {
  static const char* kNames[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                 "jul", "aug", "sep", "oct", "nov", "dec"};
  if (word.size() < 3) { return 0; }
  for (int32_t i = 0; i < 12; ++i) {
    if (word.compare(0, 3, kNames[i]) == 0) { return i + 1; }
  }
  return 0;
}

inline std::string ReadWord(const std::string& s, size_t* pos) {
  size_t i = *pos;
  while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) {
    ++i;
  }
  std::string word = s.substr(*pos, i - *pos);
  *pos = i;
  return word;
}

inline void SkipSpaces(const std::string& s, size_t* pos) {
  while (*pos < s.size() && std::isspace(static_cast<unsigned char>(s[*pos]))) {
    ++*pos;
  }
}

// YYYY-MM-DD, YYYY/MM/DD, MM/DD/YYYY, DD Mon YYYY, Mon DD[,] YYYY
inline bool ParseDate(const std::string& s, size_t* pos, DateTime* dt) {
  size_t i = *pos;

  if (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) {
    int32_t month = MonthFromName(ReadWord(s, &i));
    if (month == 0) { return false; }
    SkipSpaces(s, &i);
    if (!ReadInt(s, &i, 2, &dt->day)) { return false; }
    Expect(s, &i, ',');
    SkipSpaces(s, &i);
    if (!ReadInt(s, &i, 4, &dt->year)) { return false; }
    dt->month = month;
    *pos = i;
    return true;
  }

  size_t start = i;
  int32_t first = 0;
  if (!ReadInt(s, &i, 4, &first)) { return false; }
  size_t first_len = i - start;

  if (first_len == 4 && i < s.size() && (s[i] == '-' || s[i] == '/')) {
    char sep = s[i++];
    dt->year = first;
    if (!ReadInt(s, &i, 2, &dt->month)) { return false; }
    if (!Expect(s, &i, sep)) { return false; }
    if (!ReadInt(s, &i, 2, &dt->day)) { return false; }
    *pos = i;
    return true;
  }

  if (first_len <= 2 && Expect(s, &i, '/')) {
    dt->month = first;
    if (!ReadInt(s, &i, 2, &dt->day)) { return false; }
    if (!Expect(s, &i, '/')) { return false; }
    if (!ReadInt(s, &i, 4, &dt->year)) { return false; }
    *pos = i;
    return true;
  }

  if (first_len <= 2 && i < s.size() && s[i] == ' ') {
    dt->day = first;
    SkipSpaces(s, &i);
    int32_t month = MonthFromName(ReadWord(s, &i));
    if (month == 0) { return false; }
    SkipSpaces(s, &i);
    if (!ReadInt(s, &i, 4, &dt->year)) { return false; }
    dt->month = month;
    *pos = i;
    return true;
  }

  return false;
}

// HH:MM[:SS[.fraction]][ am|pm]
inline bool ParseTime(const std::string& s, size_t* pos, DateTime* dt) {
  size_t i = *pos;
  if (!ReadInt(s, &i, 2, &dt->hour)) { return false; }
  if (!Expect(s, &i, ':')) { return false; }
  if (!ReadInt(s, &i, 2, &dt->minute)) { return false; }
  dt->second = 0;
  if (Expect(s, &i, ':')) {
    if (!ReadInt(s, &i, 2, &dt->second)) { return false; }
    if (Expect(s, &i, '.')) {
      int32_t fraction = 0;
      if (!ReadInt(s, &i, 9, &fraction)) { return false; }
    }
  }

  size_t j = i;
  SkipSpaces(s, &j);
  std::string meridiem = ReadWord(s, &j);
  if (meridiem == "am" || meridiem == "pm") {
    if (dt->hour < 1 || dt->hour > 12) { return false; }
    if (meridiem == "am" && dt->hour == 12) { dt->hour = 0; }
    if (meridiem == "pm" && dt->hour != 12) { dt->hour += 12; }
    i = j;
  }
  *pos = i;
  return true;
}

// Z, UTC, GMT, +HH, +HHMM, +HH:MM (and '-')
inline bool SkipZone(const std::string& s, size_t* pos) {
  size_t i = *pos;
  SkipSpaces(s, &i);
  if (i == s.size()) {
    *pos = i;
    return true;
  }
  if (s[i] == 'z') {
    ++i;
  } else if (s.compare(i, 3, "utc") == 0 || s.compare(i, 3, "gmt") == 0) {
    i += 3;
  }
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
    ++i;
    int32_t hours = 0;
    if (!ReadInt(s, &i, 2, &hours)) { return false; }
    Expect(s, &i, ':');
    int32_t minutes = 0;
    ReadInt(s, &i, 2, &minutes);
  }
  SkipSpaces(s, &i);
  *pos = i;
  return i == s.size();
}

}  // namespace codec_detail

// ---------------------------------------------------------------------------
// Parsing / formatting
// ---------------------------------------------------------------------------

/// Lenient date/time parser. A time without a date means today; a date
/// without a time means midnight.
inline bool ParseDateTime(const std::string& text, DateTime* out) {
  using namespace codec_detail;

  std::string s = Lower(Trim(Unquote(Trim(text))));
  if (s.empty()) { return false; }

  DateTime dt;
  if (s == "now") {
    if (!LocalTime(std::time(nullptr), &dt)) { return false; }
    *out = dt;
    return true;
  }
  if (s == "today" || s == "tomorrow" || s == "yesterday") {
    int32_t shift = (s == "today") ? 0 : (s == "tomorrow") ? 1 : -1;
    if (!LocalDay(shift, &dt)) { return false; }
    *out = dt;
    return true;
  }

  if (s[0] == '@') {
    char* end = nullptr;
    errno = 0;
    long long epoch = std::strtoll(s.c_str() + 1, &end, 10);
    if (end == s.c_str() + 1 || *end != '\0' || errno == ERANGE) {
      return false;
    }
    if (!LocalTime(static_cast<std::time_t>(epoch), &dt) || !Valid(dt)) {
      return false;
    }
    *out = dt;
    return true;
  }

  size_t pos = 0;
  if (ParseDate(s, &pos, &dt)) {
    if (pos < s.size() && (s[pos] == 't' || s[pos] == ' ')) {
      size_t time_pos = pos + 1;
      SkipSpaces(s, &time_pos);
      if (time_pos < s.size() &&
          std::isdigit(static_cast<unsigned char>(s[time_pos]))) {
        if (!ParseTime(s, &time_pos, &dt)) { return false; }
        pos = time_pos;
      }
    }
  } else {
    DateTime today;
    if (!LocalDay(0, &today)) { return false; }
    dt.year = today.year;
    dt.month = today.month;
    dt.day = today.day;
    pos = 0;
    if (!ParseTime(s, &pos, &dt)) { return false; }
  }

  if (!SkipZone(s, &pos)) { return false; }
  if (!Valid(dt)) { return false; }
  *out = dt;
  return true;
}

inline std::string FormatTimestamp(const DateTime& dt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", dt.year,
                dt.month, dt.day, dt.hour, dt.minute, dt.second);
  return buf;
}

inline std::string FormatDate(const DateTime& dt) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", dt.year, dt.month,
                dt.day);
  return buf;
}

inline std::string FormatTime(const DateTime& dt) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", dt.hour, dt.minute,
                dt.second);
  return buf;
}

// ---------------------------------------------------------------------------
// Booleans
// ---------------------------------------------------------------------------

/// TRUE/FALSE for PostgreSQL and MySQL, '1'/'0' for MSSQL and SQLite.
inline std::string BooleanLiteral(Family family, bool value) {
  if (family == Family::kPostgresql || family == Family::kMysql) {
    return value ? "TRUE" : "FALSE";
  }
  return value ? "'1'" : "'0'";
}

/// NULL, "", 0, f, false, n, no, off (any case, optionally quoted) are
/// false; everything else is true.
inline bool ParseBoolean(const char* value) {
  using namespace codec_detail;
  if (value == nullptr) { return false; }
  std::string s = Lower(Trim(Unquote(Trim(value))));
  return !(s.empty() || s == "0" || s == "f" || s == "false" || s == "n" ||
           s == "no" || s == "off");
}

}  // namespace unidb
