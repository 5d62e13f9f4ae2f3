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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDE_DUMP_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDE_DUMP_H_

#include <filesystem>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "miraxindex/data_files.h"
#include "miraxindex/index/index_reader.h"
#include "miraxindex/report.h"
#include "miraxindex/slidedat/slide_descriptor.h"

/// @file slide_dump.h
/// @brief Whole-slide index report and blob extraction

namespace fs = std::filesystem;

namespace miraxindex {

/// @brief Report everything the index says about a slide
///
/// Sections, in order: slide info, index header, associated images (macro,
/// label, thumbnail), zoom levels, tile position refinements and the tile
/// locations of every zoom level.
///
/// @param slide_path `<slide>.mrxs` or the slide directory
/// @param reporter Destination of the report
/// Every referenced span is checked against its data file before it is
/// reported; a span past the end of the file is kCorruptIndex.
///
/// @return OkStatus, or the first decoding error
absl::Status DumpSlide(const fs::path& slide_path, const Reporter& reporter);

/// @brief Copy the blob of every tile of one level into @p output_dir
///
/// Files are named `Data<file:04>_<tile:010>.jpg`.
///
/// @return Number of files written
absl::StatusOr<int> ExtractLevelTiles(const MrxsIndexReader& reader,
                                      const DataFileSet& files, int record,
                                      const fs::path& output_dir);

/// @brief Copy the blob of every present non-hierarchical record
///
/// Records 0 to @p record_count - 1 are visited; absent ones are skipped.
/// Files are named `nonhier_<record:04>.dat`.
///
/// @return Number of files written
absl::StatusOr<int> ExtractNonHierRecords(const MrxsIndexReader& reader,
                                          const DataFileSet& files,
                                          int record_count,
                                          const fs::path& output_dir);

/// @brief Total number of non-hierarchical records named by a descriptor
int NonHierRecordCount(const SlideDescriptor& descriptor);

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDE_DUMP_H_
