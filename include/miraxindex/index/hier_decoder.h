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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_HIER_DECODER_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_HIER_DECODER_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "miraxindex/index/index_types.h"
#include "miraxindex/io/file_reader.h"

/// @file hier_decoder.h
/// @brief Decoder for hierarchical (per zoom level) records
///
/// On-disk layout reached from a hierarchical table slot:
///
///     list head:  int32 0; int32 first_page_pointer
///     page:       int32 entry_count; int32 next_page_pointer;
///                 entry_count x {tile_index, offset, length, file_number}
///
/// The chain ends at a page whose next_page_pointer is zero.

namespace miraxindex {

/// @brief Follow the page chain of one hierarchical record
///
/// A zero first page pointer, or a first page without entries and without a
/// successor, is an empty level.
///
/// @param reader Index file
/// @param table_pointer Byte offset of the record's list head
/// @return All entries in page order
/// @retval kCorruptIndex if the list head does not start with 0, a page
///         pointer lies outside the file, an entry count is negative or runs
///         past end of file, the chain loops, or an entry has negative fields
/// @retval kTruncatedRead / kInvalidOffset from the underlying reads
absl::StatusOr<std::vector<HierRecord>> ReadLevelRecords(
    const FileReader& reader, int64_t table_pointer);

/// @brief Index the records of one level by tile
///
/// If a tile index occurs more than once, the last entry wins.
TileMap BuildTileMap(const std::vector<HierRecord>& records);

/// @brief Convert a linear tile index to grid coordinates
/// @retval absl::InvalidArgumentError if @p tiles_x is not positive
absl::StatusOr<GridPosition> TileGridPosition(int32_t tile_index,
                                              int32_t tiles_x);

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_HIER_DECODER_H_
