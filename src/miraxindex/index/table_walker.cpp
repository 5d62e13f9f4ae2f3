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

#include "miraxindex/index/table_walker.h"

#include <optional>

#include "absl/strings/str_format.h"
#include "miraxindex/io/binary_utils.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

absl::StatusOr<std::vector<int32_t>> ReadTable(const FileReader& reader,
                                               int64_t base, TableMode mode) {
  RETURN_IF_ERROR(reader.Seek(base),
                  absl::StrFormat("Cannot seek to table at %d", base));

  std::vector<int32_t> table;
  bool reserved_slot_skipped = mode == TableMode::kHierarchical;

  while (true) {
    std::optional<int32_t> word;
    ASSIGN_OR_RETURN(word, TryReadLeInt32(reader),
                     absl::StrFormat("Table at %d, entry %zu", base,
                                     table.size()));
    if (!word.has_value()) {
      break;  // End of data
    }

    if (*word == 0) {
      if (!reserved_slot_skipped) {
        reserved_slot_skipped = true;
        continue;
      }
      break;
    }
    table.push_back(*word);
  }

  return table;
}

}  // namespace miraxindex
