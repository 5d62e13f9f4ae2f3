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

#include "miraxindex/index/position_map.h"

#include <optional>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "miraxindex/errors.h"
#include "miraxindex/io/binary_utils.h"
#include "miraxindex/io/file_reader.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

absl::StatusOr<std::vector<PositionRefinement>> DecodePositionMap(
    std::span<const uint8_t> bytes, int32_t images_x,
    int32_t image_divisions) {
  if (images_x < 1 || image_divisions < 1) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Invalid position grid: images_x=%d, divisions=%d",
                        images_x, image_divisions));
  }
  if (bytes.size() % constants::kPositionRecordSize != 0) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Position map length %zu is not a multiple of %zu",
                        bytes.size(), constants::kPositionRecordSize));
  }

  const size_t count = bytes.size() / constants::kPositionRecordSize;
  std::vector<PositionRefinement> refinements;

  const uint8_t* p = bytes.data();
  for (size_t i = 0; i < count; ++i, p += constants::kPositionRecordSize) {
    const uint8_t flag = p[0];
    const int32_t x = DecodeLeInt32(p + 1);
    const int32_t y = DecodeLeInt32(p + 5);

    // (0, 0) keeps the grid position
    if (x == 0 && y == 0) {
      continue;
    }

    const auto index = static_cast<int32_t>(i);
    PositionRefinement refinement;
    refinement.grid = GridPosition{(index % images_x) * image_divisions,
                                   (index / images_x) * image_divisions};
    refinement.raw_x = x;
    refinement.raw_y = y;
    refinement.x = x / constants::kPositionFixedPointScale;
    refinement.y = y / constants::kPositionFixedPointScale;
    refinement.flag = flag;
    refinements.push_back(refinement);
  }

  return refinements;
}

std::vector<uint8_t> EncodePositionMap(
    const std::vector<PositionEntry>& entries) {
  std::vector<uint8_t> out;
  out.reserve(entries.size() * constants::kPositionRecordSize);
  for (const PositionEntry& entry : entries) {
    out.push_back(entry.flag);
    io::AppendLeInt32(out, entry.x);
    io::AppendLeInt32(out, entry.y);
  }
  return out;
}

absl::StatusOr<std::vector<uint8_t>> InflatePositionLayer(
    std::vector<uint8_t> bytes, int64_t entry_count) {
  // zlib header: CMF 0x78 (deflate, 32K window)
  if (bytes.size() < 2 || bytes[0] != 0x78) {
    return bytes;
  }

  const auto expected_size = static_cast<size_t>(
      entry_count * static_cast<int64_t>(constants::kPositionRecordSize));
  std::vector<uint8_t> inflated;
  ASSIGN_OR_RETURN(inflated,
                   DecompressZlib(bytes.data(), bytes.size(), expected_size),
                   "Failed to inflate position layer");
  return inflated;
}

absl::StatusOr<std::vector<PositionEntry>> ReadStitchingPositions(
    const fs::path& path, int64_t header_offset) {
  FileReader reader;
  ASSIGN_OR_RETURN(
      reader, FileReader::Open(path, "rb"),
      absl::StrFormat("Cannot open stitching file: %s", path.string()));
  RETURN_IF_ERROR(reader.Seek(header_offset),
                  "Stitching header offset beyond file");

  std::vector<PositionEntry> entries;
  while (true) {
    std::optional<int32_t> x;
    ASSIGN_OR_RETURN(x, TryReadLeInt32(reader),
                     absl::StrFormat("Stitching entry %zu", entries.size()));
    if (!x.has_value()) {
      break;
    }

    PositionEntry entry;
    entry.x = *x;
    ASSIGN_OR_RETURN(entry.y, ReadLeInt32(reader),
                     absl::StrFormat("Stitching entry %zu y", entries.size()));
    ASSIGN_OR_RETURN(
        entry.flag, ReadLeUInt8(reader),
        absl::StrFormat("Stitching entry %zu flag", entries.size()));
    entries.push_back(entry);
  }

  return entries;
}

}  // namespace miraxindex
