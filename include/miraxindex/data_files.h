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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_DATA_FILES_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_DATA_FILES_H_

#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "miraxindex/index/index_types.h"
#include "miraxindex/io/file_reader.h"

/// @file data_files.h
/// @brief Access to the companion data files of a slide

namespace fs = std::filesystem;

namespace miraxindex {

/// @brief The numbered data files a slide's records point into
///
/// No handle is kept between calls: every read opens the referenced file,
/// reads one span and closes it again, so a slide with many rarely used files
/// never holds more than one descriptor.
class DataFileSet {
 public:
  DataFileSet() = default;

  /// @param paths Data file paths, indexed by file number
  explicit DataFileSet(std::vector<fs::path> paths)
      : paths_(std::move(paths)) {}

  size_t size() const { return paths_.size(); }

  const std::vector<fs::path>& paths() const { return paths_; }

  /// @brief Check that a location lies inside an existing data file
  ///
  /// @retval kCorruptIndex if the file number is out of range, offset or
  ///         length is negative or too large, or the span ends past the end
  ///         of the file
  /// @retval absl::NotFoundError if the data file cannot be opened
  absl::Status Validate(const DataLocation& location) const;

  /// @brief Read the bytes of one record
  absl::StatusOr<std::vector<uint8_t>> ReadBlob(
      const DataLocation& location) const;

 private:
  /// @brief Validate and return the file positioned at the blob
  absl::StatusOr<FileReader> OpenAt(const DataLocation& location) const;

  std::vector<fs::path> paths_;
};

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_DATA_FILES_H_
