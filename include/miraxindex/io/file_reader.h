// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_IO_FILE_READER_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_IO_FILE_READER_H_

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace fs = std::filesystem;

namespace miraxindex {
namespace io {

/// @brief RAII wrapper for FILE* operations
///
/// The handle is closed when the reader goes out of scope, including on every
/// early return of a failed traversal. Bounds violations are reported with the
/// index error taxonomy (see errors.h):
///
/// - Seek() outside `[0, size]` is kInvalidOffset
/// - Read() / ReadBytes() that cannot be satisfied is kTruncatedRead
///
/// Example usage:
/// ```cpp
/// FileReader reader;
/// ASSIGN_OR_RETURN(reader, FileReader::Open(path, "rb"), "Cannot open");
/// RETURN_IF_ERROR(reader.Seek(offset), "Cannot seek");
/// ```
class FileReader {
 public:
  /// @brief Default constructor (creates invalid reader)
  FileReader() : file_(nullptr, fclose) {}

  /// @brief Open a file
  /// @param path Path to file
  /// @param mode File open mode ("rb", "wb", etc.)
  /// @return FileReader instance or error
  /// @retval absl::NotFoundError if file cannot be opened
  static absl::StatusOr<FileReader> Open(const fs::path& path,
                                         const char* mode);

  FileReader(FileReader&& other) noexcept = default;
  FileReader& operator=(FileReader&& other) noexcept = default;
  ~FileReader() = default;

  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;

  /// @brief Get raw FILE pointer
  FILE* Get() const { return file_.get(); }

  /// @brief Seek to an absolute position in the file
  /// @param offset Byte offset, `0 <= offset <= size`
  /// @return OkStatus or kInvalidOffset
  absl::Status Seek(int64_t offset) const;

  /// @brief Get file size
  /// @return File size in bytes or error
  absl::StatusOr<int64_t> GetSize() const;

  /// @brief Read exactly @p size bytes
  /// @return OkStatus, or kTruncatedRead if fewer bytes are available
  absl::Status Read(void* buffer, size_t size) const;

  /// @brief Read at most @p size bytes
  /// @return Number of bytes actually read (0 at end of file)
  size_t ReadUpTo(void* buffer, size_t size) const;

  /// @brief Read exactly @p size bytes into a vector
  absl::StatusOr<std::vector<uint8_t>> ReadBytes(size_t size) const;

  /// @brief Write @p size bytes (reader opened with a write mode)
  absl::Status Write(const void* buffer, size_t size) const;

  /// @brief Get current file position
  absl::StatusOr<int64_t> Tell() const;

 private:
  explicit FileReader(FILE* file) : file_(file, fclose) {}

  std::unique_ptr<FILE, decltype(&fclose)> file_;
};

}  // namespace io

using io::FileReader;

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_IO_FILE_READER_H_
