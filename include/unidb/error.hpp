// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer
//   - Compatible with -fno-exceptions
//   - Four failure kinds: programmer, environment, connectivity, SQL

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace unidb {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kProgrammer = -1,    // caller misuse (bad family, empty SQL, ...)
  kEnvironment = -2,   // required client library not available
  kConnectivity = -3,  // connect failed or unrecognized data file
  kSql = -4,           // backend rejected a statement
  kNotOpen = -5,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:           return "Ok";
    case ErrorCode::kProgrammer:   return "ProgrammerError";
    case ErrorCode::kEnvironment:  return "EnvironmentError";
    case ErrorCode::kConnectivity: return "ConnectivityError";
    case ErrorCode::kSql:          return "SQLError";
    case ErrorCode::kNotOpen:      return "NotOpen";
  }
  return "Unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 1024;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  bool IsProgrammer() const {
    return code == ErrorCode::kProgrammer || code == ErrorCode::kNotOpen;
  }
  bool IsEnvironment() const { return code == ErrorCode::kEnvironment; }
  bool IsConnectivity() const { return code == ErrorCode::kConnectivity; }
  bool IsSql() const { return code == ErrorCode::kSql; }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }
};

/// Store `err` into `out_error` when the caller asked for it.
inline void Report(Error* out_error, const Error& err) {
  if (out_error != nullptr) { *out_error = err; }
}

}  // namespace unidb
