#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace localdisk::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

inline std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto data = ReadAll(file);
  Unwrap(file->Close());
  return data;
}

/*
  Write buffer to path (create or truncate). Not atomic on its own,
  callers write a temporary path and rename/link it into place.
*/
inline void WriteFile(const std::filesystem::path& path, const arrow::Buffer& buffer, bool fsync) {
  auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string()));
  Unwrap(out->Write(buffer.data(), buffer.size()));

  if (fsync)
    Unwrap(out->Flush());

  Unwrap(out->Close());
}

} // namespace localdisk::storage::common
