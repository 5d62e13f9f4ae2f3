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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_POSITION_MAP_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_POSITION_MAP_H_

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include "absl/status/statusor.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/index/index_types.h"

/// @file position_map.h
/// @brief Tile position map and stitching file decoding
///
/// A position map is a packed array of 9-byte entries, one per camera image
/// (images_x = tiles_x / divisions), in row-major order:
///
///     uint8 flag; int32 x; int32 y      (x, y in 1/256 pixel)
///
/// A zero (x, y) pair keeps the default grid position. Newer slides store the
/// map in a StitchingIntensityLayer record, zlib compressed.
///
/// Standalone stitching files use a different entry order, (x, y, flag),
/// after a fixed 296 byte header.

namespace fs = std::filesystem;

namespace miraxindex {

/// @brief Decode a raw position map into grid overrides
///
/// @param bytes Raw map (length multiple of 9)
/// @param images_x Camera images per row
/// @param image_divisions Tiles per camera image side
/// @return One refinement per entry with a non-zero position
/// @retval kCorruptIndex if the length is not a multiple of 9
/// @retval absl::InvalidArgumentError if images_x or image_divisions < 1
absl::StatusOr<std::vector<PositionRefinement>> DecodePositionMap(
    std::span<const uint8_t> bytes, int32_t images_x, int32_t image_divisions);

/// @brief Serialize position entries into the packed map layout
std::vector<uint8_t> EncodePositionMap(
    const std::vector<PositionEntry>& entries);

/// @brief Inflate a position layer if it carries a zlib header
///
/// Uncompressed buffers are returned unchanged.
///
/// @param bytes Record contents as read from the data file
/// @param entry_count Number of camera positions in the map
/// @retval kCorruptIndex if the stream does not inflate to 9 * entry_count
absl::StatusOr<std::vector<uint8_t>> InflatePositionLayer(
    std::vector<uint8_t> bytes, int64_t entry_count);

/// @brief Read the (x, y, flag) entries of a standalone stitching file
///
/// @param path Stitching file
/// @param header_offset Offset of the first entry
/// @return Entries in file order, until a clean end of file
/// @retval kTruncatedRead if the file ends inside an entry
/// @retval kInvalidOffset if the header offset lies beyond the file
absl::StatusOr<std::vector<PositionEntry>> ReadStitchingPositions(
    const fs::path& path,
    int64_t header_offset = constants::kStitchingHeaderOffset);

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_POSITION_MAP_H_
