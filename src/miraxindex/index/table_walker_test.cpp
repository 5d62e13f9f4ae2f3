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

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "miraxindex/errors.h"
#include "miraxindex/io/file_reader.h"
#include "miraxindex/testing/temporary.h"

namespace miraxindex {
namespace {

constexpr char kHeader[] = "01.02TABLE";
constexpr int64_t kBase = sizeof(kHeader) - 1;

class TableWalkerTest : public ::testing::Test {
 protected:
  FileReader WriteIndex(const std::vector<int32_t>& words,
                        std::vector<uint8_t> trailing = {}) {
    std::vector<uint8_t> bytes = testutil::EncodeWords(kHeader, words);
    bytes.insert(bytes.end(), trailing.begin(), trailing.end());
    const fs::path path = temp_dir_.Path() / "Index.dat";
    testutil::WriteBytes(path, bytes);
    auto reader = FileReader::Open(path, "rb");
    EXPECT_TRUE(reader.ok()) << reader.status();
    return std::move(reader).value();
  }

  testutil::TemporaryDirectory temp_dir_;
};

TEST_F(TableWalkerTest, NonHierarchicalSkipsReservedSlot) {
  FileReader reader = WriteIndex({0, 5, 9, 0, 99});
  auto table = ReadTable(reader, kBase, TableMode::kNonHierarchical);
  ASSERT_TRUE(table.ok()) << table.status();
  EXPECT_EQ(*table, (std::vector<int32_t>{5, 9}));
}

TEST_F(TableWalkerTest, HierarchicalStopsAtFirstZero) {
  FileReader reader = WriteIndex({7, 3, 0, 1});
  auto table = ReadTable(reader, kBase, TableMode::kHierarchical);
  ASSERT_TRUE(table.ok()) << table.status();
  EXPECT_EQ(*table, (std::vector<int32_t>{7, 3}));
}

TEST_F(TableWalkerTest, ImmediateTerminatorGivesEmptyTable) {
  FileReader reader = WriteIndex({0, 0, 42});

  auto hier = ReadTable(reader, kBase, TableMode::kHierarchical);
  ASSERT_TRUE(hier.ok()) << hier.status();
  EXPECT_TRUE(hier->empty());

  auto nonhier = ReadTable(reader, kBase, TableMode::kNonHierarchical);
  ASSERT_TRUE(nonhier.ok()) << nonhier.status();
  EXPECT_TRUE(nonhier->empty());
}

TEST_F(TableWalkerTest, CleanEndOfDataEndsTable) {
  FileReader reader = WriteIndex({0, 4, 8});
  auto table = ReadTable(reader, kBase, TableMode::kNonHierarchical);
  ASSERT_TRUE(table.ok()) << table.status();
  EXPECT_EQ(*table, (std::vector<int32_t>{4, 8}));
}

TEST_F(TableWalkerTest, PartialWordIsTruncatedRead) {
  FileReader reader = WriteIndex({7}, {0x01, 0x02});
  auto table = ReadTable(reader, kBase, TableMode::kHierarchical);
  ASSERT_FALSE(table.ok());
  EXPECT_TRUE(IsIndexError(table.status(), IndexErrorKind::kTruncatedRead));
}

TEST_F(TableWalkerTest, BaseOutsideFileIsInvalidOffset) {
  FileReader reader = WriteIndex({7, 0});
  auto table = ReadTable(reader, 4096, TableMode::kHierarchical);
  ASSERT_FALSE(table.ok());
  EXPECT_TRUE(IsIndexError(table.status(), IndexErrorKind::kInvalidOffset));
}

}  // namespace
}  // namespace miraxindex
