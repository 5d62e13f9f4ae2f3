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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_NONHIER_DECODER_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_NONHIER_DECODER_H_

#include <cstdint>
#include <optional>

#include "absl/status/statusor.h"
#include "miraxindex/index/index_types.h"
#include "miraxindex/io/file_reader.h"

/// @file nonhier_decoder.h
/// @brief Decoder for non-hierarchical (single blob) records
///
/// On-disk layout reached from a non-hierarchical table slot:
///
///     list head:  int32 page_size_or_sentinel; int32 page_pointer
///     page:       int32 1; int32 0; int32 0; int32 0;
///                 int32 offset; int32 length; int32 file_number
///
/// Unused slots hold a zero pointer. Following it lands on the "01.0" bytes
/// at the start of the file, which therefore serve as the absent marker.

namespace miraxindex {

/// @brief Resolve one non-hierarchical slot
///
/// @param reader Index file
/// @param slot_offset Byte offset of the slot (table base + 4 * record)
/// @return Blob location, or std::nullopt if the record is absent
/// @retval kCorruptIndex if the page-size word is neither the absent marker
///         nor zero, or the page prologue is not (1, 0, 0, 0)
absl::StatusOr<std::optional<DataLocation>> ReadNonHierRecord(
    const FileReader& reader, int64_t slot_offset);

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_NONHIER_DECODER_H_
