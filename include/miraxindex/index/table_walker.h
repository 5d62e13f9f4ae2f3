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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_TABLE_WALKER_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_TABLE_WALKER_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "miraxindex/index/index_types.h"
#include "miraxindex/io/file_reader.h"

namespace miraxindex {

/// @brief Read a run of pointer words starting at @p base
///
/// The order of the returned words is the order in the file; it determines
/// the layer / level numbering of the records. A terminator right at @p base
/// gives an empty table, as does a clean end of file. In
/// TableMode::kNonHierarchical the first zero word is a reserved slot and is
/// skipped; the second one ends the table.
///
/// @param reader Index file
/// @param base Byte offset of the first table word
/// @param mode Termination convention
/// @return Table words without terminators
/// @retval kInvalidOffset if @p base lies outside the file
/// @retval kTruncatedRead if the table ends in a partial word
absl::StatusOr<std::vector<int32_t>> ReadTable(const FileReader& reader,
                                               int64_t base, TableMode mode);

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_TABLE_WALKER_H_
