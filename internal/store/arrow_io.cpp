#include "arrow_io.hpp"

#include <arrow/io/file.h>

#include <system_error>

namespace fleetwatch::store {

std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto size = Unwrap(file->GetSize());
  auto data = Unwrap(file->Read(size));
  Unwrap(file->Close());
  return data;
}

void WriteFileAtomic(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& data) {
  const auto tmp_path = path.string() + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(data->data(), data->size()));
    Unwrap(out->Flush());
    Unwrap(out->Close());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw util::StoreError("rename " + tmp_path + " -> " + path.string() + " failed");
  }
}

void AppendFile(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& data) {
  bool needs_newline = false;

  std::error_code ec;
  const auto      existing_size = std::filesystem::file_size(path, ec);
  if (!ec && existing_size > 0) {
    auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
    auto last = Unwrap(file->ReadAt(static_cast<int64_t>(existing_size) - 1, 1));
    Unwrap(file->Close());
    needs_newline = last->size() == 1 && last->data()[0] != '\n';
  }

  auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string(), /*append=*/true));
  if (needs_newline) {
    Unwrap(out->Write("\n", 1));
  }
  Unwrap(out->Write(data->data(), data->size()));
  Unwrap(out->Flush());
  Unwrap(out->Close());
}

} // namespace fleetwatch::store
