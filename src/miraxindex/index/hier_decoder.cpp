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

#include "miraxindex/index/hier_decoder.h"

#include <set>

#include "absl/strings/str_format.h"
#include "miraxindex/errors.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/io/binary_utils.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

namespace {

constexpr int64_t kPageHeaderSize = 2 * constants::kWordSize;
constexpr int64_t kEntrySize = 4 * constants::kWordSize;

}  // namespace

absl::StatusOr<std::vector<HierRecord>> ReadLevelRecords(
    const FileReader& reader, int64_t table_pointer) {
  int64_t file_size = 0;
  ASSIGN_OR_RETURN(file_size, reader.GetSize(), "Cannot get index size");

  RETURN_IF_ERROR(
      reader.Seek(table_pointer),
      absl::StrFormat("Cannot seek to level list head at %d", table_pointer));

  // List head: [0][first_page_pointer]
  int32_t head_zero = 0;
  ASSIGN_OR_RETURN(head_zero, ReadLeInt32(reader),
                   "Cannot read level list head");
  if (head_zero != 0) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Expected 0 at level list head %d, got %d",
                        table_pointer, head_zero));
  }

  int32_t page_pointer = 0;
  ASSIGN_OR_RETURN(page_pointer, ReadLeInt32(reader),
                   "Cannot read first page pointer");

  std::vector<HierRecord> records;
  std::set<int64_t> visited_pages;
  int page_number = 0;

  while (page_pointer != 0) {
    if (page_pointer < 0 || page_pointer + kPageHeaderSize > file_size) {
      return MAKE_INDEX_ERROR(
          kCorruptIndex,
          absl::StrFormat("Page %d pointer %d outside index of %d bytes",
                          page_number, page_pointer, file_size));
    }
    if (!visited_pages.insert(page_pointer).second) {
      return MAKE_INDEX_ERROR(
          kCorruptIndex,
          absl::StrFormat("Page chain loops back to %d at page %d",
                          page_pointer, page_number));
    }

    RETURN_IF_ERROR(reader.Seek(page_pointer),
                    absl::StrFormat("Cannot seek to page %d", page_number));

    int32_t entry_count = 0;
    ASSIGN_OR_RETURN(entry_count, ReadLeInt32(reader),
                     absl::StrFormat("Cannot read entry count of page %d",
                                     page_number));
    int32_t next_page_pointer = 0;
    ASSIGN_OR_RETURN(next_page_pointer, ReadLeInt32(reader),
                     absl::StrFormat("Cannot read next pointer of page %d",
                                     page_number));

    const int64_t entries_end =
        page_pointer + kPageHeaderSize +
        static_cast<int64_t>(entry_count) * kEntrySize;
    if (entry_count < 0 || entries_end > file_size) {
      return MAKE_INDEX_ERROR(
          kCorruptIndex,
          absl::StrFormat("Page %d at %d declares %d entries, index has %d "
                          "bytes",
                          page_number, page_pointer, entry_count, file_size));
    }

    records.reserve(records.size() + entry_count);
    for (int32_t i = 0; i < entry_count; ++i) {
      HierRecord record;
      ASSIGN_OR_RETURN(record.tile_index, ReadLeInt32(reader),
                       absl::StrFormat("Page %d entry %d", page_number, i));
      ASSIGN_OR_RETURN(record.offset, ReadLeInt32(reader),
                       absl::StrFormat("Page %d entry %d", page_number, i));
      ASSIGN_OR_RETURN(record.length, ReadLeInt32(reader),
                       absl::StrFormat("Page %d entry %d", page_number, i));
      ASSIGN_OR_RETURN(record.file_number, ReadLeInt32(reader),
                       absl::StrFormat("Page %d entry %d", page_number, i));

      if (record.tile_index < 0 || record.offset < 0 || record.length < 0 ||
          record.file_number < 0) {
        return MAKE_INDEX_ERROR(
            kCorruptIndex,
            absl::StrFormat("Negative field in page %d entry %d: (%d, %d, %d, "
                            "%d)",
                            page_number, i, record.tile_index, record.offset,
                            record.length, record.file_number));
      }
      records.push_back(record);
    }

    page_pointer = next_page_pointer;
    ++page_number;
  }

  return records;
}

TileMap BuildTileMap(const std::vector<HierRecord>& records) {
  TileMap tiles;
  for (const HierRecord& record : records) {
    tiles[record.tile_index] = DataLocation{record.file_number, record.offset,
                                            record.length};
  }
  return tiles;
}

absl::StatusOr<GridPosition> TileGridPosition(int32_t tile_index,
                                              int32_t tiles_x) {
  if (tiles_x < 1) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Invalid grid width: %d", tiles_x));
  }
  return GridPosition{tile_index % tiles_x, tile_index / tiles_x};
}

}  // namespace miraxindex
