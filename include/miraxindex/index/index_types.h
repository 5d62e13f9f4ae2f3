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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_TYPES_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_TYPES_H_

/// @file index_types.h
/// @brief Record types produced by the index decoders
///
/// All types are plain read-only projections of on-disk records.

#include <cstdint>
#include <map>
#include <string>

#include "miraxindex/index/index_constants.h"

namespace miraxindex {

/// @brief How a pointer table is terminated
enum class TableMode : std::uint8_t {
  /// Stop at the first zero word
  kHierarchical,
  /// Skip one reserved zero slot, then stop at the next zero word
  kNonHierarchical,
};

/// @brief One tile entry of a hierarchical (per zoom level) record
///
/// Entries are stored in pages of `(tile_index, offset, length, file_number)`
/// 4-tuples.
struct HierRecord {
  /// @brief Linear index of the image in the level grid
  int32_t tile_index = 0;

  /// @brief Byte offset of the blob within the data file
  int32_t offset = 0;

  /// @brief Size of the blob in bytes
  int32_t length = 0;

  /// @brief Index of the companion data file (0-based)
  int32_t file_number = 0;

  bool operator==(const HierRecord&) const = default;
};

/// @brief Location of a blob inside a companion data file
struct DataLocation {
  int32_t file_number = 0;
  int64_t offset = 0;
  int64_t length = 0;

  bool operator==(const DataLocation&) const = default;
};

/// @brief Tile index to blob location, for one zoom level
using TileMap = std::map<int32_t, DataLocation>;

/// @brief Coarse grid coordinates of an image
struct GridPosition {
  int32_t x = 0;
  int32_t y = 0;

  bool operator==(const GridPosition&) const = default;
};

/// @brief One raw 9-byte position entry
struct PositionEntry {
  uint8_t flag = 0;
  int32_t x = 0;  ///< 1/256 pixel units
  int32_t y = 0;  ///< 1/256 pixel units

  bool operator==(const PositionEntry&) const = default;
};

/// @brief Refined placement of an image that overrides its grid position
struct PositionRefinement {
  GridPosition grid;     ///< Coarse grid origin of the image
  int32_t raw_x = 0;     ///< Raw fixed-point x
  int32_t raw_y = 0;     ///< Raw fixed-point y
  double x = 0.0;        ///< Pixel x (raw_x / 256)
  double y = 0.0;        ///< Pixel y (raw_y / 256)
  uint8_t flag = 0;
};

/// @brief Header of an index file as announced by the slide descriptor
///
/// The word stream starts right after the version and the slide id.
struct IndexLayout {
  std::string version = constants::kIndexVersion;
  std::string slide_id;

  /// @brief Offset of the first word (the hierarchical root pointer)
  int64_t HeaderOffset() const {
    return static_cast<int64_t>(version.size() + slide_id.size());
  }
};

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_TYPES_H_
