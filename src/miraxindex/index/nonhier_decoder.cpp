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

#include "miraxindex/index/nonhier_decoder.h"

#include "absl/strings/str_format.h"
#include "miraxindex/errors.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/io/binary_utils.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

absl::StatusOr<std::optional<DataLocation>> ReadNonHierRecord(
    const FileReader& reader, int64_t slot_offset) {
  RETURN_IF_ERROR(reader.Seek(slot_offset),
                  absl::StrFormat("Cannot seek to slot at %d", slot_offset));

  int32_t list_head = 0;
  ASSIGN_OR_RETURN(list_head, ReadLeInt32(reader),
                   "Cannot read list head pointer");
  RETURN_IF_ERROR(reader.Seek(list_head),
                  absl::StrFormat("Cannot seek to list head %d", list_head));

  int32_t page_size = 0;
  ASSIGN_OR_RETURN(page_size, ReadLeInt32(reader), "Cannot read page size");
  if (page_size == constants::kAbsentRecordSentinel) {
    return std::optional<DataLocation>();
  }
  if (page_size != 0) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Expected page size 0 at list head %d, got %d",
                        list_head, page_size));
  }

  int32_t page_pointer = 0;
  ASSIGN_OR_RETURN(page_pointer, ReadLeInt32(reader),
                   "Cannot read data page pointer");
  RETURN_IF_ERROR(
      reader.Seek(page_pointer),
      absl::StrFormat("Cannot seek to data page %d", page_pointer));

  for (int i = 0; i < 4; ++i) {
    int32_t word = 0;
    ASSIGN_OR_RETURN(word, ReadLeInt32(reader),
                     absl::StrFormat("Cannot read prologue word %d", i));
    if (word != constants::kNonHierPrologue[i]) {
      return MAKE_INDEX_ERROR(
          kCorruptIndex,
          absl::StrFormat("Data page %d prologue word %d is %d, expected %d",
                          page_pointer, i, word,
                          constants::kNonHierPrologue[i]));
    }
  }

  int32_t offset = 0;
  int32_t length = 0;
  int32_t file_number = 0;
  ASSIGN_OR_RETURN(offset, ReadLeInt32(reader), "Cannot read data offset");
  ASSIGN_OR_RETURN(length, ReadLeInt32(reader), "Cannot read data length");
  ASSIGN_OR_RETURN(file_number, ReadLeInt32(reader),
                   "Cannot read data file number");

  return std::optional<DataLocation>(
      DataLocation{file_number, offset, length});
}

}  // namespace miraxindex
