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

#include "miraxindex/index/hier_decoder.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "miraxindex/errors.h"
#include "miraxindex/io/file_reader.h"
#include "miraxindex/testing/temporary.h"

namespace miraxindex {
namespace {

constexpr char kHeader[] = "01.02X";
constexpr int32_t kHeaderSize = sizeof(kHeader) - 1;

/// Byte address of word @p index
constexpr int32_t Addr(int32_t index) { return kHeaderSize + 4 * index; }

class HierDecoderTest : public ::testing::Test {
 protected:
  FileReader WriteIndex(const std::vector<int32_t>& words) {
    const fs::path path = temp_dir_.Path() / "Index.dat";
    testutil::WriteBytes(path, testutil::EncodeWords(kHeader, words));
    auto reader = FileReader::Open(path, "rb");
    EXPECT_TRUE(reader.ok()) << reader.status();
    return std::move(reader).value();
  }

  testutil::TemporaryDirectory temp_dir_;
};

TEST_F(HierDecoderTest, ReadsChainedPages) {
  FileReader reader = WriteIndex({
      0, Addr(2),                 // list head
      2, Addr(12),                // page 0
      0, 100, 10, 0,              //
      1, 110, 20, 1,              //
      1, 0,                       // page 1
      5, 200, 30, 0,              //
  });

  auto records = ReadLevelRecords(reader, Addr(0));
  ASSERT_TRUE(records.ok()) << records.status();
  ASSERT_EQ(records->size(), 3u);
  EXPECT_EQ((*records)[0], (HierRecord{0, 100, 10, 0}));
  EXPECT_EQ((*records)[1], (HierRecord{1, 110, 20, 1}));
  EXPECT_EQ((*records)[2], (HierRecord{5, 200, 30, 0}));
}

TEST_F(HierDecoderTest, ZeroFirstPageIsEmptyLevel) {
  FileReader reader = WriteIndex({0, 0});
  auto records = ReadLevelRecords(reader, Addr(0));
  ASSERT_TRUE(records.ok()) << records.status();
  EXPECT_TRUE(records->empty());
}

TEST_F(HierDecoderTest, EmptyFirstPageIsEmptyLevel) {
  FileReader reader = WriteIndex({
      0, Addr(2),  // list head
      0, 0,        // page 0: no entries, no next page
  });
  auto records = ReadLevelRecords(reader, Addr(0));
  ASSERT_TRUE(records.ok()) << records.status();
  EXPECT_TRUE(records->empty());
  EXPECT_TRUE(BuildTileMap(*records).empty());
}

TEST_F(HierDecoderTest, PageLoopIsCorruptIndex) {
  FileReader reader = WriteIndex({0, Addr(2), 0, Addr(2)});
  auto records = ReadLevelRecords(reader, Addr(0));
  ASSERT_FALSE(records.ok());
  EXPECT_TRUE(IsIndexError(records.status(), IndexErrorKind::kCorruptIndex));
}

TEST_F(HierDecoderTest, PagePointerOutsideFileIsCorruptIndex) {
  FileReader reader = WriteIndex({0, 99999});
  auto records = ReadLevelRecords(reader, Addr(0));
  ASSERT_FALSE(records.ok());
  EXPECT_TRUE(IsIndexError(records.status(), IndexErrorKind::kCorruptIndex));
}

TEST_F(HierDecoderTest, EntryCountPastEndIsCorruptIndex) {
  FileReader reader = WriteIndex({0, Addr(2), 5, 0, 1, 2, 3, 0});
  auto records = ReadLevelRecords(reader, Addr(0));
  ASSERT_FALSE(records.ok());
  EXPECT_TRUE(IsIndexError(records.status(), IndexErrorKind::kCorruptIndex));
}

TEST_F(HierDecoderTest, NonZeroListHeadIsCorruptIndex) {
  FileReader reader = WriteIndex({1, 0});
  auto records = ReadLevelRecords(reader, Addr(0));
  ASSERT_FALSE(records.ok());
  EXPECT_TRUE(IsIndexError(records.status(), IndexErrorKind::kCorruptIndex));
}

TEST_F(HierDecoderTest, NegativeFieldIsCorruptIndex) {
  FileReader reader = WriteIndex({0, Addr(2), 1, 0, 0, -5, 1, 0});
  auto records = ReadLevelRecords(reader, Addr(0));
  ASSERT_FALSE(records.ok());
  EXPECT_TRUE(IsIndexError(records.status(), IndexErrorKind::kCorruptIndex));
}

TEST_F(HierDecoderTest, ListHeadOutsideFileIsInvalidOffset) {
  FileReader reader = WriteIndex({0, 0});
  auto records = ReadLevelRecords(reader, 4096);
  ASSERT_FALSE(records.ok());
  EXPECT_TRUE(IsIndexError(records.status(), IndexErrorKind::kInvalidOffset));
}

TEST(BuildTileMapTest, LastEntryForATileWins) {
  TileMap tiles = BuildTileMap({
      {3, 100, 10, 0},
      {4, 110, 10, 0},
      {3, 500, 50, 1},
  });
  ASSERT_EQ(tiles.size(), 2u);
  EXPECT_EQ(tiles.at(3), (DataLocation{1, 500, 50}));
  EXPECT_EQ(tiles.at(4), (DataLocation{0, 110, 10}));
}

TEST(TileGridPositionTest, RowMajorIndex) {
  EXPECT_EQ(*TileGridPosition(0, 3), (GridPosition{0, 0}));
  EXPECT_EQ(*TileGridPosition(7, 3), (GridPosition{1, 2}));
  EXPECT_EQ(*TileGridPosition(2, 3), (GridPosition{2, 0}));
}

TEST(TileGridPositionTest, ZeroWidthIsInvalidArgument) {
  auto grid = TileGridPosition(7, 0);
  ASSERT_FALSE(grid.ok());
  EXPECT_EQ(grid.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_FALSE(GetIndexErrorKind(grid.status()).has_value());
}

}  // namespace
}  // namespace miraxindex
