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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_CONSTANTS_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_CONSTANTS_H_

#include <cstddef>
#include <cstdint>

/// @file index_constants.h
/// @brief Format constants of the MIRAX index

namespace miraxindex {
namespace constants {

/// @brief Index file version string
///
/// Every index starts with these 5 bytes, followed by the slide id.
constexpr const char* kIndexVersion = "01.02";

/// @brief Size of the version field in bytes
constexpr size_t kIndexVersionSize = 5;

/// @brief Size of one word of the word stream
constexpr int64_t kWordSize = 4;

/// @brief Header offset of the common 32 character slide id
constexpr int64_t kDefaultHeaderOffset = 37;

/// @brief Page-size word that marks a non-hierarchical record as absent
///
/// This is "01.0" read as a little-endian int32: an unused slot holds a zero
/// list-head pointer, and following it lands on the version bytes at the
/// start of the file.
constexpr int32_t kAbsentRecordSentinel = 0x302e3130;

/// @brief Word that introduces a table of 4-tuples in the word stream
constexpr int32_t kTupleTableMarker = 128;

/// @brief Fourth field of every 4-tuple inside a tuple table
constexpr int32_t kTupleTypeTag = 4;

/// @brief Prologue of a non-hierarchical data page
constexpr int32_t kNonHierPrologue[4] = {1, 0, 0, 0};

/// @brief Size of each tile position record in bytes
///
/// Position format (9 bytes total):
/// - 1 byte: flag
/// - 4 bytes: x coordinate (little-endian int32)
/// - 4 bytes: y coordinate (little-endian int32)
constexpr size_t kPositionRecordSize = 9;

/// @brief Fixed-point scale of position coordinates (1/256 pixel)
constexpr double kPositionFixedPointScale = 256.0;

/// @brief Offset of the first entry in a standalone stitching file
constexpr int64_t kStitchingHeaderOffset = 296;

/// @brief Maximum allowed size for a single data blob in bytes (100 MB)
///
/// Guards allocations when a corrupted record declares a huge length.
constexpr int64_t kMaxBlobSize = 100 * 1024 * 1024;

}  // namespace constants
}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_INDEX_CONSTANTS_H_
