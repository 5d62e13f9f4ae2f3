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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_WRITER_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_WRITER_H_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "miraxindex/index/index_types.h"

/// @file index_writer.h
/// @brief Encoder for synthetic index files
///
/// Produces the layout read by MrxsIndexReader:
///
///     header | two root pointers
///     hierarchical table:      one slot per level, 0
///     non-hierarchical table:  one slot per record, 0, 0
///     list heads and pages
///
/// Absent non-hierarchical records get a zero slot, as in scanner output.

namespace fs = std::filesystem;

namespace miraxindex {

/// @brief Builds an index from in-memory records
///
/// Usage:
/// ```cpp
/// IndexWriter writer(layout);
/// writer.AddLevel({{HierRecord{0, 0, 100, 0}}});
/// writer.AddNonHierRecord(std::nullopt);
/// RETURN_IF_ERROR(writer.WriteTo(dir / "Index.dat"), "write");
/// ```
class IndexWriter {
 public:
  /// @brief One page of a hierarchical record
  using Page = std::vector<HierRecord>;

  explicit IndexWriter(IndexLayout layout) : layout_(std::move(layout)) {}

  /// @brief Append a hierarchical record (zoom level)
  ///
  /// Pages are chained in the given order. No pages gives a level with a
  /// zero first page pointer.
  /// @return Record index of the level
  int AddLevel(std::vector<Page> pages);

  /// @brief Append a non-hierarchical record, std::nullopt for absent
  /// @return Record index
  int AddNonHierRecord(std::optional<DataLocation> location);

  /// @brief Serialize the index
  /// @retval absl::InvalidArgumentError if a non-hierarchical offset or
  ///         length does not fit a 32-bit word
  absl::StatusOr<std::vector<uint8_t>> Build() const;

  /// @brief Serialize the index into a file
  absl::Status WriteTo(const fs::path& path) const;

 private:
  IndexLayout layout_;
  std::vector<std::vector<Page>> levels_;
  std::vector<std::optional<DataLocation>> nonhier_records_;
};

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_WRITER_H_
