#pragma once

#include <arrow/result.h>

#include <string>

namespace routebroker::util {

/*
  File reading on top of Arrow IO.

  Files ending in ".gz" are decompressed through Arrow's gzip codec
  (gzip and zlib framing are auto-detected).
*/

arrow::Result<std::string> ReadFileContents(const std::string& path);
arrow::Result<std::string> ReadGzipFileContents(const std::string& path);

// Dispatches on the ".gz" suffix.
arrow::Result<std::string> ReadDocument(const std::string& path);

// Throwing variant for callers that report failures as exceptions.
std::string ReadDocumentOrThrow(const std::string& path);

} // namespace routebroker::util
