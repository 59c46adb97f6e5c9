#include "arrow_io.hpp"

#include <arrow/buffer.h>
#include <arrow/io/compressed.h>
#include <arrow/io/file.h>
#include <arrow/util/compression.h>

#include <stdexcept>

namespace routebroker::util {

namespace {

constexpr int64_t kReadChunkBytes = 1 << 20;

bool HasGzipSuffix(const std::string& path) {
  return path.size() >= 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

arrow::Status DrainInto(arrow::io::InputStream& stream, std::string* out) {
  for (;;) {
    ARROW_ASSIGN_OR_RAISE(auto chunk, stream.Read(kReadChunkBytes));
    if (chunk->size() == 0) break;
    out->append(reinterpret_cast<const char*>(chunk->data()), static_cast<size_t>(chunk->size()));
  }
  return stream.Close();
}

} // namespace

arrow::Result<std::string> ReadFileContents(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path));

  std::string contents;
  ARROW_RETURN_NOT_OK(DrainInto(*file, &contents));
  return contents;
}

arrow::Result<std::string> ReadGzipFileContents(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto codec, arrow::util::Codec::Create(arrow::Compression::GZIP));
  ARROW_ASSIGN_OR_RAISE(auto raw, arrow::io::ReadableFile::Open(path));
  ARROW_ASSIGN_OR_RAISE(auto stream, arrow::io::CompressedInputStream::Make(codec.get(), raw));

  std::string contents;
  ARROW_RETURN_NOT_OK(DrainInto(*stream, &contents));
  return contents;
}

arrow::Result<std::string> ReadDocument(const std::string& path) {
  if (HasGzipSuffix(path)) {
    return ReadGzipFileContents(path);
  }
  return ReadFileContents(path);
}

std::string ReadDocumentOrThrow(const std::string& path) {
  auto result = ReadDocument(path);
  if (!result.ok()) {
    throw std::runtime_error("failed to read " + path + ": " + result.status().ToString());
  }
  return std::move(result).ValueUnsafe();
}

} // namespace routebroker::util
