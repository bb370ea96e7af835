// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Result -- outcome of one executed statement.
//
// Design:
//   - Rows are materialized by the backend, random access via SeekRow()
//   - Forward iteration via Eof()/NextRow()
//   - Type-safe field accessors with null defaults
//   - Carries statement metadata: returned/affected rows, generated id
//   - Plain value type, no handle into the connection

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace unidb {

// ---------------------------------------------------------------------------
// Result
// ---------------------------------------------------------------------------

class Result {
 public:
  Result() = default;
  explicit Result(std::string sql) : sql_(std::move(sql)) {}

  // --- Statement metadata ---

  const std::string& Sql() const { return sql_; }
  void SetSql(std::string sql) { sql_ = std::move(sql); }

  /// Backend success flag for the statement.
  bool Success() const { return success_; }
  void SetSuccess(bool success) { success_ = success; }

  uint64_t ReturnedRows() const { return returned_rows_; }
  void SetReturnedRows(uint64_t rows) { returned_rows_ = rows; }

  uint64_t AffectedRows() const { return affected_rows_; }
  void SetAffectedRows(uint64_t rows) { affected_rows_ = rows; }

  bool HasGeneratedId() const { return has_generated_id_; }
  int64_t GeneratedId(int64_t null_value = 0) const {
    return has_generated_id_ ? generated_id_ : null_value;
  }
  void SetGeneratedId(int64_t id) {
    generated_id_ = id;
    has_generated_id_ = true;
  }
  void ClearGeneratedId() {
    generated_id_ = 0;
    has_generated_id_ = false;
  }

  // --- Building (used by backends) ---

  void AddColumn(const char* name) {
    columns_.emplace_back(name != nullptr ? name : "");
  }

  void BeginRow() {
    rows_.emplace_back();
    rows_.back().reserve(columns_.size());
  }

  void AddField(const char* data, size_t len) {
    if (rows_.empty()) { BeginRow(); }
    Field f;
    if (data != nullptr) {
      f.value.assign(data, len);
      f.is_null = false;
    }
    rows_.back().push_back(std::move(f));
  }

  void AddField(const char* data) {
    AddField(data, data != nullptr ? std::strlen(data) : 0);
  }

  void AddNull() { AddField(nullptr, 0); }

  // --- Field info ---

  int32_t NumFields() const { return static_cast<int32_t>(columns_.size()); }
  uint32_t NumRows() const { return static_cast<uint32_t>(rows_.size()); }
  bool HasRows() const { return !columns_.empty(); }

  int32_t FieldIndex(const char* name) const {
    if (name == nullptr) { return -1; }
    for (size_t i = 0; i < columns_.size(); ++i) {
      if (columns_[i] == name) { return static_cast<int32_t>(i); }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (col < 0 || col >= NumFields()) { return nullptr; }
    return columns_[static_cast<size_t>(col)].c_str();
  }

  // --- Field values ---

  const char* FieldValue(int32_t col) const {
    const Field* f = At(col);
    return (f != nullptr && !f->is_null) ? f->value.c_str() : nullptr;
  }

  const char* FieldValue(const char* name) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? FieldValue(idx) : nullptr;
  }

  /// Byte length of the field, binary data may contain NULs.
  size_t FieldLength(int32_t col) const {
    const Field* f = At(col);
    return (f != nullptr) ? f->value.size() : 0;
  }

  bool FieldIsNull(int32_t col) const {
    const Field* f = At(col);
    return f == nullptr || f->is_null;
  }

  bool FieldIsNull(const char* name) const {
    return FieldIsNull(FieldIndex(name));
  }

  // --- Typed accessors ---

  int32_t GetInt(int32_t col, int32_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return static_cast<int32_t>(std::strtol(FieldValue(col), nullptr, 10));
  }

  int32_t GetInt(const char* name, int32_t null_value = 0) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetInt(idx, null_value) : null_value;
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return static_cast<int64_t>(std::strtoll(FieldValue(col), nullptr, 10));
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    if (FieldIsNull(col)) { return null_value; }
    return std::strtod(FieldValue(col), nullptr);
  }

  double GetDouble(const char* name, double null_value = 0.0) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetDouble(idx, null_value) : null_value;
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    return FieldValue(col);
  }

  const char* GetString(const char* name,
                        const char* null_value = "") const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetString(idx, null_value) : null_value;
  }

  std::string GetBlob(int32_t col) const {
    const Field* f = At(col);
    return (f != nullptr) ? f->value : std::string();
  }

  // --- Navigation ---

  bool Eof() const { return current_row_ >= rows_.size(); }

  void NextRow() {
    if (current_row_ < rows_.size()) { ++current_row_; }
  }

  void SeekRow(uint32_t row) {
    if (rows_.empty()) { return; }
    current_row_ = (row < rows_.size()) ? row : rows_.size() - 1;
  }

  uint32_t CurrentRow() const { return static_cast<uint32_t>(current_row_); }

 private:
  struct Field {
    std::string value;
    bool is_null = true;
  };

  const Field* At(int32_t col) const {
    if (current_row_ >= rows_.size() || col < 0) { return nullptr; }
    const std::vector<Field>& row = rows_[current_row_];
    if (static_cast<size_t>(col) >= row.size()) { return nullptr; }
    return &row[static_cast<size_t>(col)];
  }

  std::string sql_;
  bool success_ = false;
  uint64_t returned_rows_ = 0;
  uint64_t affected_rows_ = 0;
  int64_t generated_id_ = 0;
  bool has_generated_id_ = false;

  std::vector<std::string> columns_;
  std::vector<std::vector<Field>> rows_;
  size_t current_row_ = 0;
};

}  // namespace unidb
