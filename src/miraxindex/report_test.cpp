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

#include "miraxindex/report.h"

#include <gtest/gtest.h>

#include <sstream>

namespace miraxindex {
namespace {

TEST(ReportTest, FormatsFieldsAndSections) {
  EXPECT_EQ(FormatReportEntry({0, "Slide ID", "abc", false}),
            "Slide ID:                      abc");
  EXPECT_EQ(FormatReportEntry({1, "Zoom levels", "", true}),
            "  Zoom levels:");
  EXPECT_EQ(FormatReportEntry({2, "Tile width", "256", false}),
            "    Tile width:                    256");
}

TEST(ReportTest, ChildrenIndent) {
  std::ostringstream out;
  TextReportSink sink(out);
  Reporter root(sink);
  root.Field("Tiles in X", 4);
  const Reporter level = root.Child("Level 0").Child("Tile");
  EXPECT_EQ(level.depth(), 2);
  level.Field("Overlap X", 1.5);

  EXPECT_EQ(out.str(),
            "Tiles in X:                    4\n"
            "Level 0:\n"
            "  Tile:\n"
            "    Overlap X:                     1.5\n");
}

TEST(ReportTest, CollectingSinkFindsFields) {
  CollectingReportSink sink;
  Reporter root(sink);
  root.Child("File");
  root.Field("File", "Data0000.dat");

  ASSERT_EQ(sink.entries().size(), 2u);
  EXPECT_TRUE(sink.entries()[0].is_section);
  EXPECT_EQ(sink.Find("File"), "Data0000.dat");
  EXPECT_EQ(sink.Find("Missing"), "");
}

}  // namespace
}  // namespace miraxindex
