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

#include "miraxindex/index/index_writer.h"

#include <limits>

#include "absl/strings/str_format.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/io/binary_utils.h"
#include "miraxindex/io/file_reader.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

namespace {

bool FitsWord(int64_t value) {
  return value >= std::numeric_limits<int32_t>::min() &&
         value <= std::numeric_limits<int32_t>::max();
}

}  // namespace

int IndexWriter::AddLevel(std::vector<Page> pages) {
  levels_.push_back(std::move(pages));
  return static_cast<int>(levels_.size()) - 1;
}

int IndexWriter::AddNonHierRecord(std::optional<DataLocation> location) {
  nonhier_records_.push_back(location);
  return static_cast<int>(nonhier_records_.size()) - 1;
}

absl::StatusOr<std::vector<uint8_t>> IndexWriter::Build() const {
  for (size_t record = 0; record < nonhier_records_.size(); ++record) {
    const std::optional<DataLocation>& location = nonhier_records_[record];
    if (location.has_value() && (!FitsWord(location->offset) ||
                                 !FitsWord(location->length))) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("Record %d span %d + %d does not fit the index",
                          record, location->offset, location->length));
    }
  }

  const int64_t header_offset = layout_.HeaderOffset();

  // Word stream; pointers are filled in once their target is placed
  std::vector<int32_t> words;
  auto address = [header_offset](size_t word_index) {
    return static_cast<int32_t>(header_offset +
                                constants::kWordSize *
                                    static_cast<int64_t>(word_index));
  };

  const size_t hier_root = words.size();
  words.push_back(0);
  const size_t nonhier_root = words.size();
  words.push_back(0);

  words[hier_root] = address(words.size());
  const size_t hier_slots = words.size();
  words.resize(words.size() + levels_.size() + 1, 0);

  words[nonhier_root] = address(words.size());
  const size_t nonhier_slots = words.size();
  words.resize(words.size() + nonhier_records_.size() + 2, 0);

  for (size_t level = 0; level < levels_.size(); ++level) {
    words[hier_slots + level] = address(words.size());
    words.push_back(0);
    size_t link = words.size();
    words.push_back(0);

    for (const Page& page : levels_[level]) {
      words[link] = address(words.size());
      words.push_back(static_cast<int32_t>(page.size()));
      link = words.size();
      words.push_back(0);
      for (const HierRecord& record : page) {
        words.push_back(record.tile_index);
        words.push_back(record.offset);
        words.push_back(record.length);
        words.push_back(record.file_number);
      }
    }
  }

  for (size_t record = 0; record < nonhier_records_.size(); ++record) {
    const std::optional<DataLocation>& location = nonhier_records_[record];
    if (!location.has_value()) {
      continue;  // Zero slot
    }
    words[nonhier_slots + record] = address(words.size());
    words.push_back(0);
    const size_t link = words.size();
    words.push_back(0);

    words[link] = address(words.size());
    for (int32_t prologue : constants::kNonHierPrologue) {
      words.push_back(prologue);
    }
    words.push_back(static_cast<int32_t>(location->offset));
    words.push_back(static_cast<int32_t>(location->length));
    words.push_back(location->file_number);
  }

  std::vector<uint8_t> out(layout_.version.begin(), layout_.version.end());
  out.insert(out.end(), layout_.slide_id.begin(), layout_.slide_id.end());
  out.reserve(out.size() + words.size() * constants::kWordSize);
  for (int32_t word : words) {
    io::AppendLeInt32(out, word);
  }
  return out;
}

absl::Status IndexWriter::WriteTo(const fs::path& path) const {
  std::vector<uint8_t> bytes;
  ASSIGN_OR_RETURN(bytes, Build(), "Failed to encode index");

  FileReader file;
  ASSIGN_OR_RETURN(
      file, FileReader::Open(path, "wb"),
      absl::StrFormat("Cannot create index file: %s", path.string()));
  RETURN_IF_ERROR(file.Write(bytes.data(), bytes.size()),
                  "Failed to write index");
  return absl::OkStatus();
}

}  // namespace miraxindex
