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

#include "miraxindex/index/index_reader.h"

#include <string>
#include <string_view>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "miraxindex/errors.h"
#include "miraxindex/index/hier_decoder.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/index/nonhier_decoder.h"
#include "miraxindex/index/table_walker.h"
#include "miraxindex/io/binary_utils.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

absl::StatusOr<MrxsIndexReader> MrxsIndexReader::Open(
    const fs::path& index_path, const IndexLayout& layout) {
  FileReader file;
  ASSIGN_OR_RETURN(
      file, FileReader::Open(index_path, "rb"),
      absl::StrFormat("Cannot open index file: %s", index_path.string()));

  int64_t file_size = 0;
  ASSIGN_OR_RETURN(file_size, file.GetSize(), "Cannot get index file size");

  int64_t hierarchical_table = 0;
  int64_t nonhierarchical_table = 0;
  RETURN_IF_ERROR(ReadHeader(file, layout, file_size, hierarchical_table,
                             nonhierarchical_table),
                  "Failed to read index file header");

  LOG(INFO) << "Opened index " << index_path.string()
            << ": hierarchical table " << hierarchical_table
            << ", non-hierarchical table " << nonhierarchical_table;

  return MrxsIndexReader(std::move(file), layout, file_size,
                         hierarchical_table, nonhierarchical_table);
}

absl::Status MrxsIndexReader::ReadHeader(const FileReader& file,
                                         const IndexLayout& layout,
                                         int64_t file_size,
                                         int64_t& hierarchical_table,
                                         int64_t& nonhierarchical_table) {
  const int64_t header_offset = layout.HeaderOffset();
  if (file_size < header_offset) {
    return MAKE_INDEX_ERROR(
        kFormatMismatch,
        absl::StrFormat("Index of %d bytes is shorter than its %d byte header",
                        file_size, header_offset));
  }

  std::string header(static_cast<size_t>(header_offset), '\0');
  RETURN_IF_ERROR(file.Seek(0), "Cannot seek to index header");
  RETURN_IF_ERROR(file.Read(header.data(), header.size()),
                  "Failed to read index header");

  const std::string_view version =
      std::string_view(header).substr(0, layout.version.size());
  if (version != layout.version) {
    return MAKE_INDEX_ERROR(
        kFormatMismatch,
        absl::StrFormat("Unsupported index version: %s (expected %s)",
                        std::string(version), layout.version));
  }

  const std::string_view slide_id =
      std::string_view(header).substr(layout.version.size());
  if (slide_id != layout.slide_id) {
    return MAKE_INDEX_ERROR(
        kFormatMismatch,
        absl::StrFormat("Index belongs to slide %s, expected %s",
                        std::string(slide_id), layout.slide_id));
  }

  // Checked before any record is decoded
  if ((file_size - header_offset) % constants::kWordSize != 0) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Word stream of %d bytes is not word aligned",
                        file_size - header_offset));
  }

  int32_t hier = 0;
  ASSIGN_OR_RETURN(hier, ReadLeInt32(file),
                   "Failed to read hierarchical root pointer");
  int32_t nonhier = 0;
  ASSIGN_OR_RETURN(nonhier, ReadLeInt32(file),
                   "Failed to read non-hierarchical root pointer");

  hierarchical_table = hier;
  nonhierarchical_table = nonhier;
  return absl::OkStatus();
}

MrxsIndexReader::MrxsIndexReader(FileReader file, IndexLayout layout,
                                 int64_t file_size, int64_t hierarchical_table,
                                 int64_t nonhierarchical_table)
    : file_(std::move(file)),
      layout_(std::move(layout)),
      file_size_(file_size),
      hierarchical_table_(hierarchical_table),
      nonhierarchical_table_(nonhierarchical_table) {}

absl::StatusOr<std::vector<int32_t>> MrxsIndexReader::HierarchicalTable()
    const {
  std::vector<int32_t> table;
  ASSIGN_OR_RETURN(
      table, ReadTable(file_, hierarchical_table_, TableMode::kHierarchical),
      "Failed to read hierarchical table");
  return table;
}

absl::StatusOr<std::vector<int32_t>> MrxsIndexReader::NonHierarchicalTable()
    const {
  std::vector<int32_t> table;
  ASSIGN_OR_RETURN(table,
                   ReadTable(file_, nonhierarchical_table_,
                             TableMode::kNonHierarchical),
                   "Failed to read non-hierarchical table");
  return table;
}

absl::StatusOr<int64_t> MrxsIndexReader::ReadSlot(int64_t table,
                                                  int record) const {
  if (record < 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Invalid record index: %d", record));
  }

  const int64_t slot = table + constants::kWordSize * record;
  RETURN_IF_ERROR(file_.Seek(slot),
                  absl::StrFormat("Cannot seek to slot of record %d", record));
  int32_t list_head = 0;
  ASSIGN_OR_RETURN(list_head, ReadLeInt32(file_),
                   absl::StrFormat("Cannot read slot of record %d", record));
  return list_head;
}

absl::StatusOr<std::vector<HierRecord>> MrxsIndexReader::ReadLevelRecords(
    int record) const {
  int64_t list_head = 0;
  ASSIGN_OR_RETURN(list_head, ReadSlot(hierarchical_table_, record),
                   absl::StrFormat("Level %d", record));

  std::vector<HierRecord> records;
  ASSIGN_OR_RETURN(records, ::miraxindex::ReadLevelRecords(file_, list_head),
                   absl::StrFormat("Level %d", record));
  return records;
}

absl::StatusOr<TileMap> MrxsIndexReader::ReadLevelTiles(int record) const {
  std::vector<HierRecord> records;
  ASSIGN_OR_RETURN(records, ReadLevelRecords(record));
  return BuildTileMap(records);
}

absl::StatusOr<std::optional<DataLocation>> MrxsIndexReader::ReadNonHierRecord(
    int record) const {
  if (record < 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Invalid record index: %d", record));
  }

  std::optional<DataLocation> location;
  ASSIGN_OR_RETURN(
      location,
      ::miraxindex::ReadNonHierRecord(
          file_, nonhierarchical_table_ + constants::kWordSize * record),
      absl::StrFormat("Non-hierarchical record %d", record));
  return location;
}

}  // namespace miraxindex
