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

#include "miraxindex/errors.h"

#include <gtest/gtest.h>

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {
namespace {

absl::Status FailCorrupt() {
  return MAKE_INDEX_ERROR(kCorruptIndex, "Page chain loops");
}

absl::Status PropagateOnce() {
  RETURN_IF_ERROR(FailCorrupt(), "Reading level 0");
  return absl::OkStatus();
}

absl::StatusOr<int> PropagateTwice() {
  RETURN_IF_ERROR(PropagateOnce(), "Dumping slide");
  return 1;
}

TEST(IndexErrorTest, KindsMapToCanonicalCodes) {
  EXPECT_EQ(IndexErrorKindCode(IndexErrorKind::kTruncatedRead),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(IndexErrorKindCode(IndexErrorKind::kInvalidOffset),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(IndexErrorKindCode(IndexErrorKind::kCorruptIndex),
            absl::StatusCode::kDataLoss);
  EXPECT_EQ(IndexErrorKindCode(IndexErrorKind::kFormatMismatch),
            absl::StatusCode::kFailedPrecondition);
}

TEST(IndexErrorTest, MakeIndexErrorCarriesKind) {
  absl::Status status =
      MakeIndexError(IndexErrorKind::kTruncatedRead, "short read");
  EXPECT_EQ(status.code(), absl::StatusCode::kOutOfRange);
  EXPECT_EQ(status.message(), "short read");
  ASSERT_TRUE(GetIndexErrorKind(status).has_value());
  EXPECT_EQ(*GetIndexErrorKind(status), IndexErrorKind::kTruncatedRead);
  EXPECT_TRUE(IsIndexError(status, IndexErrorKind::kTruncatedRead));
  EXPECT_FALSE(IsIndexError(status, IndexErrorKind::kCorruptIndex));
}

TEST(IndexErrorTest, KindSurvivesPropagation) {
  absl::StatusOr<int> result = PropagateTwice();
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status().code(), absl::StatusCode::kDataLoss);
  EXPECT_TRUE(IsIndexError(result.status(), IndexErrorKind::kCorruptIndex));

  // Root message first, then one frame per propagation
  const std::string message(result.status().message());
  EXPECT_EQ(message.rfind("Page chain loops", 0), 0u);
  EXPECT_NE(message.find("Reading level 0"), std::string::npos);
  EXPECT_NE(message.find("Dumping slide"), std::string::npos);
  EXPECT_EQ(status::StripStackTrace(message), "Page chain loops");
}

TEST(IndexErrorTest, ForeignAndOkStatusesHaveNoKind) {
  EXPECT_FALSE(GetIndexErrorKind(absl::OkStatus()).has_value());
  EXPECT_FALSE(GetIndexErrorKind(absl::NotFoundError("missing")).has_value());
  EXPECT_FALSE(
      IsIndexError(absl::DataLossError("no payload"),
                   IndexErrorKind::kCorruptIndex));
}

TEST(IndexErrorTest, KindNames) {
  EXPECT_EQ(IndexErrorKindName(IndexErrorKind::kTruncatedRead),
            "TruncatedRead");
  EXPECT_EQ(IndexErrorKindName(IndexErrorKind::kInvalidOffset),
            "InvalidOffset");
  EXPECT_EQ(IndexErrorKindName(IndexErrorKind::kCorruptIndex),
            "CorruptIndex");
  EXPECT_EQ(IndexErrorKindName(IndexErrorKind::kFormatMismatch),
            "FormatMismatch");
}

}  // namespace
}  // namespace miraxindex
