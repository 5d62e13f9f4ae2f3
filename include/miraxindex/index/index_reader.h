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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_READER_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_READER_H_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "miraxindex/index/index_types.h"
#include "miraxindex/io/file_reader.h"

/// @file index_reader.h
/// @brief Reader for the MIRAX Index.dat file
///
/// File layout:
///
///     "01.02" <slide id>                   header, header_offset bytes
///     int32 hierarchical_table_pointer      at header_offset
///     int32 nonhierarchical_table_pointer   at header_offset + 4
///     ...                                   words up to end of file
///
/// Record r of a table lives in the slot at `table + 4 * r` and points to the
/// record's list head (see hier_decoder.h and nonhier_decoder.h).

namespace fs = std::filesystem;

namespace miraxindex {

/// @brief Reader for one index file
///
/// Holds the index file open for its lifetime; every lookup is a sequence of
/// seeks and reads on that handle.
///
/// Usage:
/// ```cpp
/// MrxsIndexReader reader;
/// ASSIGN_OR_RETURN(reader,
///                  MrxsIndexReader::Open(index_path, descriptor.Layout()));
/// TileMap tiles;
/// ASSIGN_OR_RETURN(tiles, reader.ReadLevelTiles(0));
/// ```
class MrxsIndexReader {
 public:
  MrxsIndexReader() = default;

  /// @brief Open an index file and validate its header
  ///
  /// @param index_path Path to Index.dat
  /// @param layout Version and slide id announced by the descriptor
  /// @return Reader or error
  /// @retval absl::NotFoundError if the file cannot be opened
  /// @retval kFormatMismatch if version or slide id differ from @p layout
  /// @retval kCorruptIndex if the word stream is not word aligned
  static absl::StatusOr<MrxsIndexReader> Open(const fs::path& index_path,
                                              const IndexLayout& layout);

  MrxsIndexReader(MrxsIndexReader&& other) noexcept = default;
  MrxsIndexReader& operator=(MrxsIndexReader&& other) noexcept = default;
  ~MrxsIndexReader() = default;

  MrxsIndexReader(const MrxsIndexReader&) = delete;
  MrxsIndexReader& operator=(const MrxsIndexReader&) = delete;

  /// @brief Slots of the hierarchical table, one per zoom level
  absl::StatusOr<std::vector<int32_t>> HierarchicalTable() const;

  /// @brief Slots of the non-hierarchical table
  absl::StatusOr<std::vector<int32_t>> NonHierarchicalTable() const;

  /// @brief All entries of hierarchical record @p record, in page order
  absl::StatusOr<std::vector<HierRecord>> ReadLevelRecords(int record) const;

  /// @brief Entries of hierarchical record @p record, keyed by tile index
  absl::StatusOr<TileMap> ReadLevelTiles(int record) const;

  /// @brief Location of non-hierarchical record @p record
  /// @return Location, or std::nullopt if the record is absent
  absl::StatusOr<std::optional<DataLocation>> ReadNonHierRecord(
      int record) const;

  const IndexLayout& layout() const { return layout_; }
  int64_t file_size() const { return file_size_; }
  int64_t hierarchical_table() const { return hierarchical_table_; }
  int64_t nonhierarchical_table() const { return nonhierarchical_table_; }

 private:
  MrxsIndexReader(FileReader file, IndexLayout layout, int64_t file_size,
                  int64_t hierarchical_table, int64_t nonhierarchical_table);

  /// @brief Validate version and slide id, read both table pointers
  static absl::Status ReadHeader(const FileReader& file,
                                 const IndexLayout& layout, int64_t file_size,
                                 int64_t& hierarchical_table,
                                 int64_t& nonhierarchical_table);

  /// @brief Read the list head pointer stored in a table slot
  absl::StatusOr<int64_t> ReadSlot(int64_t table, int record) const;

  FileReader file_;                    ///< Index file handle (RAII)
  IndexLayout layout_;                 ///< Expected header
  int64_t file_size_ = 0;              ///< Index size in bytes
  int64_t hierarchical_table_ = 0;     ///< Base of the hierarchical table
  int64_t nonhierarchical_table_ = 0;  ///< Base of the non-hierarchical table
};

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_READER_H_
