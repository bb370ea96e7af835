// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb demo -- one code path for every database family.
//
// Usage:
//   ./unidb_demo                         (SQLite, in memory)
//   ./unidb_demo <family> <dsn>          e.g. postgresql "localhost::me::demo"

#include <cstdio>
#include <string>
#include <vector>

#include "unidb/db.hpp"

static void PrintRows(unidb::Result& r) {
  for (int32_t c = 0; c < r.NumFields(); ++c) {
    std::printf("%s%s", c > 0 ? " | " : "  ", r.FieldName(c));
  }
  std::printf("\n");
  while (!r.Eof()) {
    for (int32_t c = 0; c < r.NumFields(); ++c) {
      std::printf("%s%s", c > 0 ? " | " : "  ", r.GetString(c, "NULL"));
    }
    std::printf("\n");
    r.NextRow();
  }
}

int main(int argc, char** argv) {
  unidb::Database db;
  unidb::Error err;

  if (argc >= 3) {
    err = db.Open(argv[1], argv[2]);
  } else {
    unidb::Credentials creds;
    creds.database = ":memory:";
    err = db.Open(unidb::Family::kSqlite, creds);
  }
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed [%s]: %s\n",
                 unidb::ErrorCodeName(err.code), err.message);
    return 1;
  }
  db.SetDebug(true);
  std::printf("Connected: %s via %s\n", unidb::FamilyLabel(db.GetFamily()),
              unidb::BackendName(db.GetBackend()));

  // Schema, portable through the translator
  db.Query("DROP TABLE IF EXISTS demo_emp", &err);
  const char* create = "CREATE TABLE demo_emp (empno INTEGER, "
                       "empname VARCHAR(64), hired VARCHAR(32), "
                       "active BOOLEAN)";
  db.Query(create, &err);
  if (!err.ok()) {
    std::fprintf(stderr, "%s\n", err.message);
    return 1;
  }

  // Batch of inserts in one call
  std::string sql;
  const char* names[] = {"Alice", "Bob", "O'Hara"};
  for (int32_t i = 0; i < 3; ++i) {
    sql += "INSERT INTO demo_emp VALUES (" + std::to_string(i + 1) + ", " +
           db.EscapeString(names[i]) + ", " +
           db.EscapeTimestamp("2024-03-0" + std::to_string(i + 1) + " 09:00") +
           ", " + db.EscapeBoolean(i != 1) + ");";
  }
  std::vector<unidb::Result> results = db.Query(sql, &err);
  if (!err.ok()) {
    std::fprintf(stderr, "%s\n", err.message);
    return 1;
  }
  std::printf("Ran %zu inserts\n", results.size());

  // Update
  results = db.TranslatedQuery(
      "UPDATE demo_emp SET active = TRUE WHERE empno = 2", &err);
  if (err.ok()) {
    std::printf("Updated %llu row(s)\n",
                static_cast<unsigned long long>(results[0].AffectedRows()));
  }

  // Query
  std::printf("\n--- Query ---\n");
  results = db.Query("SELECT * FROM demo_emp ORDER BY empno", &err);
  if (err.ok()) { PrintRows(results[0]); }

  // Error reporting
  std::printf("\n--- Error ---\n");
  db.Query("SELECT * FROM demo_missing", &err);
  std::printf("  %s: %s\n", unidb::ErrorCodeName(err.code), err.message);

  db.Query("DROP TABLE demo_emp", &err);
  std::printf("\nTotal query time: %.6f s\n", db.QueryTime());
  db.Close();
  return 0;
}
