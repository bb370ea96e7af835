// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Credentials -- connection parameters and DSN parsing.
//
// DSN format: "host:port:user:password:database"
//   e.g. "localhost:3306:root:pass:testdb"
//   or   "::::/var/db/app.sqlite" (SQLite, file path only)
// Every field may be empty. The database field takes the rest of the string,
// so it may itself contain ':'. An empty port means "not set"; no default
// port is substituted.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

#include "unidb/error.hpp"

namespace unidb {

// ---------------------------------------------------------------------------
// Credentials
// ---------------------------------------------------------------------------

struct Credentials {
  std::string database;  // name, or file path for SQLite
  std::string username;
  std::string password;
  std::string host;
  uint16_t port = 0;     // 0 = not set

  bool HasPort() const { return port != 0; }

  /// "host" or "host:port", the latter only when a port was given.
  std::string HostAndPort() const {
    if (!HasPort()) { return host; }
    return host + ":" + std::to_string(port);
  }
};

// ---------------------------------------------------------------------------
// ParseDsn
// ---------------------------------------------------------------------------

inline Error ParseDsn(const char* dsn, Credentials* out) {
  if (dsn == nullptr) {
    return Error::Make(ErrorCode::kProgrammer, "dsn is null");
  }

  std::string parts[5];
  int32_t count = 0;
  const char* p = dsn;
  const char* start = p;
  while (*p != '\0' && count < 4) {
    if (*p == ':') {
      parts[count++].assign(start, static_cast<size_t>(p - start));
      start = p + 1;
    }
    ++p;
  }
  parts[count].assign(start);

  Credentials creds;
  creds.host = parts[0];
  if (!parts[1].empty()) {
    char* end = nullptr;
    unsigned long port = std::strtoul(parts[1].c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || port == 0 || port > 65535) {
      Error err;
      err.SetFormat(ErrorCode::kProgrammer, "Invalid port in dsn: '%s'",
                    parts[1].c_str());
      return err;
    }
    creds.port = static_cast<uint16_t>(port);
  }
  creds.username = parts[2];
  creds.password = parts[3];
  creds.database = parts[4];

  if (out != nullptr) { *out = creds; }
  return Error::Ok();
}

}  // namespace unidb
