#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace fleetwatch::store {

/*
  Helper: unwrap Arrow Result<T> or throw util::StoreError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::StoreError(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StoreError(status.ToString());
}

/*
  Read entire file into buffer
*/
std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path);

/*
  Atomic replace:
      write tmp → flush → rename
*/
void WriteFileAtomic(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& data);

/*
  Appends data with a single write. A missing trailing newline left by an
  interrupted earlier write is repaired first so rows never merge.
*/
void AppendFile(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& data);

} // namespace fleetwatch::store
