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

#include "miraxindex/data_files.h"

#include "absl/strings/str_format.h"
#include "miraxindex/errors.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

absl::StatusOr<FileReader> DataFileSet::OpenAt(
    const DataLocation& location) const {
  if (location.file_number < 0 ||
      location.file_number >= static_cast<int32_t>(paths_.size())) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Invalid file number: %d (slide has %zu data files)",
                        location.file_number, paths_.size()));
  }
  if (location.offset < 0 || location.length < 0) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Invalid span: offset %d, length %d", location.offset,
                        location.length));
  }
  // Prevent bad_alloc from unreasonably large allocations
  if (location.length > constants::kMaxBlobSize) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Length %d exceeds maximum allowed size of %d",
                        location.length, constants::kMaxBlobSize));
  }

  const fs::path& path = paths_[location.file_number];
  FileReader file;
  ASSIGN_OR_RETURN(
      file, FileReader::Open(path, "rb"),
      absl::StrFormat("Cannot open data file: %s", path.string()));

  int64_t file_size = 0;
  ASSIGN_OR_RETURN(file_size, file.GetSize(),
                   "Failed to determine data file size");
  if (location.offset + location.length > file_size) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Span %d + %d extends beyond %s (%d bytes)",
                        location.offset, location.length,
                        path.filename().string(), file_size));
  }

  RETURN_IF_ERROR(file.Seek(location.offset), "Failed to seek in data file");
  return file;
}

absl::Status DataFileSet::Validate(const DataLocation& location) const {
  FileReader file;
  ASSIGN_OR_RETURN(file, OpenAt(location));
  return absl::OkStatus();
}

absl::StatusOr<std::vector<uint8_t>> DataFileSet::ReadBlob(
    const DataLocation& location) const {
  FileReader file;
  ASSIGN_OR_RETURN(file, OpenAt(location));

  std::vector<uint8_t> data;
  ASSIGN_OR_RETURN(data,
                   file.ReadBytes(static_cast<size_t>(location.length)),
                   "Failed to read record data");
  return data;
}

}  // namespace miraxindex
