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

#include "miraxindex/index/pointer_walker.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "miraxindex/errors.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/testing/temporary.h"

namespace miraxindex {
namespace {

constexpr int64_t kHeaderOffset = constants::kDefaultHeaderOffset;

/// Pointer value of word @p index
constexpr int32_t Addr(int32_t index) {
  return static_cast<int32_t>(kHeaderOffset) + 4 * index;
}

std::vector<WalkEventKind> Kinds(const CollectingWalkSink& sink) {
  std::vector<WalkEventKind> kinds;
  for (const WalkEvent& event : sink.events()) {
    kinds.push_back(event.kind);
  }
  return kinds;
}

TEST(ClassifyWordTest, PointerCandidateBoundaries) {
  constexpr int64_t kNumItems = 10;
  EXPECT_TRUE(IsPointerCandidate(Addr(0), kHeaderOffset, kNumItems));
  EXPECT_TRUE(IsPointerCandidate(Addr(9), kHeaderOffset, kNumItems));
  EXPECT_FALSE(IsPointerCandidate(Addr(10), kHeaderOffset, kNumItems));
  EXPECT_FALSE(IsPointerCandidate(Addr(-1), kHeaderOffset, kNumItems));
  EXPECT_FALSE(IsPointerCandidate(Addr(3) + 1, kHeaderOffset, kNumItems));
  EXPECT_FALSE(IsPointerCandidate(kHeaderOffset - 1, kHeaderOffset,
                                  kNumItems));
}

TEST(ClassifyWordTest, ClassificationOrder) {
  constexpr int64_t kNumItems = 100;
  EXPECT_EQ(ClassifyWord(0, kHeaderOffset, kNumItems), WordClass::kNull);
  EXPECT_EQ(ClassifyWord(constants::kTupleTableMarker, kHeaderOffset,
                         kNumItems),
            WordClass::kTupleMarker);
  EXPECT_EQ(ClassifyWord(Addr(5), kHeaderOffset, kNumItems),
            WordClass::kPointer);
  EXPECT_EQ(ClassifyWord(7, kHeaderOffset, kNumItems), WordClass::kLiteral);
  EXPECT_EQ(ClassifyWord(-4, kHeaderOffset, kNumItems), WordClass::kLiteral);
}

TEST(DumpWordsTest, CollapsesZeroRuns) {
  auto snapshot =
      WordStreamSnapshot::FromWords({5, 0, 0, 0, Addr(1)}, kHeaderOffset);
  CollectingWalkSink sink;
  DumpWords(snapshot, sink);

  ASSERT_EQ(Kinds(sink),
            (std::vector<WalkEventKind>{
                WalkEventKind::kLiteral, WalkEventKind::kSkippedZeros,
                WalkEventKind::kPointer, WalkEventKind::kEndOfStream}));

  const auto& events = sink.events();
  EXPECT_EQ(events[0].value, 5);
  EXPECT_EQ(events[1].index, 1);
  EXPECT_EQ(events[1].count, 3);
  EXPECT_EQ(events[2].index, 4);
  EXPECT_EQ(events[2].target, 1);
  EXPECT_EQ(events[3].count, 5);
}

TEST(DumpWordsTest, DecodesTupleTable) {
  auto snapshot = WordStreamSnapshot::FromWords(
      {constants::kTupleTableMarker, 10, 20, 0, 4, 11, 21, 0, 4, 7},
      kHeaderOffset);
  CollectingWalkSink sink;
  DumpWords(snapshot, sink);

  ASSERT_EQ(Kinds(sink),
            (std::vector<WalkEventKind>{
                WalkEventKind::kTupleTable, WalkEventKind::kTuple,
                WalkEventKind::kTuple, WalkEventKind::kLiteral,
                WalkEventKind::kEndOfStream}));

  const auto& events = sink.events();
  EXPECT_EQ(events[0].count, 2);
  EXPECT_EQ(events[1].tuple, (TupleGroup{10, 20, 0, 4}));
  EXPECT_EQ(events[2].index, 5);
  EXPECT_EQ(events[2].tuple, (TupleGroup{11, 21, 0, 4}));
  // The group that does not end in the type tag is left to the dump
  EXPECT_EQ(events[3].index, 9);
  EXPECT_EQ(events[3].value, 7);
}

TEST(DumpWordsTest, ReportsTrailingBytes) {
  auto snapshot = WordStreamSnapshot::FromWords({1}, kHeaderOffset, 3);
  CollectingWalkSink sink;
  DumpWords(snapshot, sink);

  EXPECT_EQ(sink.Count(WalkEventKind::kTrailingBytes), 1u);
  EXPECT_EQ(sink.events().back().kind, WalkEventKind::kEndOfStream);
  EXPECT_EQ(sink.events()[1].count, 3);
}

TEST(DumpWordsTest, TextSinkFormatsLines) {
  auto snapshot =
      WordStreamSnapshot::FromWords({5, 0, 0, Addr(0)}, kHeaderOffset);
  std::ostringstream out;
  TextWalkSink sink(out);
  DumpWords(snapshot, sink);

  const std::string text = out.str();
  EXPECT_NE(text.find("      0           5\n"), std::string::npos);
  EXPECT_NE(text.find("-3"), std::string::npos);
  EXPECT_NE(text.find("end of stream, 4 words"), std::string::npos);
}

TEST(WalkGraphTest, CycleEndsInBackReference) {
  auto snapshot =
      WordStreamSnapshot::FromWords({Addr(2), 9, Addr(0)}, kHeaderOffset);
  CollectingWalkSink sink;
  WalkGraph(snapshot, 0, sink);

  ASSERT_EQ(Kinds(sink),
            (std::vector<WalkEventKind>{
                WalkEventKind::kPointer, WalkEventKind::kBackReference,
                WalkEventKind::kLiteral, WalkEventKind::kGraphExhausted}));

  const auto& events = sink.events();
  EXPECT_EQ(events[0].target, 2);
  EXPECT_EQ(events[1].index, 2);
  EXPECT_EQ(events[1].target, 0);
  EXPECT_EQ(events[2].index, 1);
  EXPECT_EQ(events[3].count, 3);
}

TEST(WalkGraphTest, ZeroRunsEndTables) {
  auto snapshot = WordStreamSnapshot::FromWords({Addr(3), 0, 0, 5, 0, 0},
                                                kHeaderOffset);
  CollectingWalkSink sink;
  WalkGraph(snapshot, 0, sink);

  ASSERT_EQ(Kinds(sink),
            (std::vector<WalkEventKind>{
                WalkEventKind::kPointer, WalkEventKind::kLiteral,
                WalkEventKind::kSkippedZeros, WalkEventKind::kSkippedZeros,
                WalkEventKind::kGraphExhausted}));

  const auto& events = sink.events();
  EXPECT_EQ(events[2].index, 4);
  EXPECT_EQ(events[2].count, 2);
  EXPECT_EQ(events[3].index, 1);
  EXPECT_EQ(events[3].count, 2);
  EXPECT_EQ(events[4].count, 6);
}

TEST(WalkGraphTest, WalksThroughTupleTable) {
  auto snapshot = WordStreamSnapshot::FromWords(
      {constants::kTupleTableMarker, 1, 2, 3, 4, 99}, kHeaderOffset);
  CollectingWalkSink sink;
  WalkGraph(snapshot, 0, sink);

  ASSERT_EQ(Kinds(sink),
            (std::vector<WalkEventKind>{
                WalkEventKind::kTupleTable, WalkEventKind::kTuple,
                WalkEventKind::kLiteral, WalkEventKind::kGraphExhausted}));
  EXPECT_EQ(sink.events().back().count, 6);
}

TEST(WalkGraphTest, TupleTableStopsAtVisitedWords) {
  // Word 0 jumps into the middle of the table before its marker is reached
  auto snapshot = WordStreamSnapshot::FromWords(
      {Addr(3), constants::kTupleTableMarker, 9, 9, 9, 4, 0}, kHeaderOffset);
  CollectingWalkSink sink;
  WalkGraph(snapshot, 0, sink);

  ASSERT_EQ(Kinds(sink),
            (std::vector<WalkEventKind>{
                WalkEventKind::kPointer, WalkEventKind::kLiteral,
                WalkEventKind::kLiteral, WalkEventKind::kLiteral,
                WalkEventKind::kSkippedZeros, WalkEventKind::kTupleTable,
                WalkEventKind::kLiteral, WalkEventKind::kGraphExhausted}));

  const auto& events = sink.events();
  EXPECT_EQ(events[5].index, 1);
  EXPECT_EQ(events[5].count, 0);
  EXPECT_EQ(events[6].index, 2);
  EXPECT_EQ(events.back().count, 7);
}

TEST(WalkGraphTest, StartOutsideStreamIsExhaustedImmediately) {
  auto snapshot = WordStreamSnapshot::FromWords({1, 2}, kHeaderOffset);
  CollectingWalkSink sink;
  WalkGraph(snapshot, 5, sink);

  ASSERT_EQ(sink.events().size(), 1u);
  EXPECT_EQ(sink.events()[0].kind, WalkEventKind::kGraphExhausted);
  EXPECT_EQ(sink.events()[0].count, 0);
}

class WordStreamSnapshotTest : public ::testing::Test {
 protected:
  testutil::TemporaryDirectory temp_dir_;
};

TEST_F(WordStreamSnapshotTest, LoadKeepsPartialWordAsFinding) {
  const std::string header = "01.02SNAPSHOT";
  std::vector<uint8_t> bytes = testutil::EncodeWords(header, {3, 0, 7});
  bytes.push_back(0xAA);
  bytes.push_back(0xBB);
  const fs::path path = temp_dir_.Path() / "Index.dat";
  testutil::WriteBytes(path, bytes);

  auto snapshot = WordStreamSnapshot::Load(path, header.size());
  ASSERT_TRUE(snapshot.ok()) << snapshot.status();
  EXPECT_EQ(snapshot->num_items(), 3);
  EXPECT_EQ(snapshot->words(), (std::vector<int32_t>{3, 0, 7}));
  EXPECT_EQ(snapshot->trailing_bytes(), 2u);
}

TEST_F(WordStreamSnapshotTest, HeaderOffsetPastEndIsFormatMismatch) {
  const fs::path path = temp_dir_.Path() / "Index.dat";
  testutil::WriteBytes(path, testutil::EncodeWords("01.02", {1}));

  auto snapshot = WordStreamSnapshot::Load(path, 64);
  ASSERT_FALSE(snapshot.ok());
  EXPECT_TRUE(
      IsIndexError(snapshot.status(), IndexErrorKind::kFormatMismatch));
}

TEST_F(WordStreamSnapshotTest, MissingFileIsNotFound) {
  auto snapshot =
      WordStreamSnapshot::Load(temp_dir_.Path() / "missing.dat", 37);
  ASSERT_FALSE(snapshot.ok());
  EXPECT_EQ(snapshot.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace miraxindex
