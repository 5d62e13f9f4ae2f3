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

#include "miraxindex/slidedat/ini_file.h"

#include <gtest/gtest.h>

#include <string>

#include "miraxindex/testing/temporary.h"

namespace miraxindex {
namespace slidedat {
namespace {

constexpr char kIni[] =
    "\xEF\xBB\xBF[GENERAL]\n"
    "SLIDE_ID = 0123abcd\n"
    "; comment line\n"
    "# another comment\n"
    "IMAGENUMBER_X=12\r\n"
    "objective_magnification = 20.5\n"
    "BROKEN = twelve\n"
    "FORMULA = a=b\n"
    "\n"
    "[ general ]\n"
    "SLIDE_ID = lower\n"
    "line without separator\n";

TEST(IniFileTest, ParsesSectionsAndStripsBom) {
  IniFile ini = IniFile::Parse(kIni);
  EXPECT_TRUE(ini.HasSection("GENERAL"));

  auto id = ini.GetString("GENERAL", "SLIDE_ID");
  ASSERT_TRUE(id.ok()) << id.status();
  EXPECT_EQ(*id, "0123abcd");

  // Values keep everything after the first separator
  auto formula = ini.GetString("GENERAL", "FORMULA");
  ASSERT_TRUE(formula.ok()) << formula.status();
  EXPECT_EQ(*formula, "a=b");
}

TEST(IniFileTest, KeysAreCaseInsensitiveSectionsAreNot) {
  IniFile ini = IniFile::Parse(kIni);

  auto x = ini.GetInt("GENERAL", "imagenumber_x");
  ASSERT_TRUE(x.ok()) << x.status();
  EXPECT_EQ(*x, 12);
  EXPECT_TRUE(ini.HasKey("GENERAL", "OBJECTIVE_MAGNIFICATION"));

  // Section names are trimmed but keep their case
  EXPECT_TRUE(ini.HasSection("general"));
  auto lower = ini.GetString("general", "slide_id");
  ASSERT_TRUE(lower.ok()) << lower.status();
  EXPECT_EQ(*lower, "lower");
}

TEST(IniFileTest, CommentsAndJunkLinesAreIgnored) {
  IniFile ini = IniFile::Parse(kIni);
  EXPECT_FALSE(ini.HasKey("GENERAL", "; comment line"));
  EXPECT_FALSE(ini.HasKey("general", "line without separator"));
}

TEST(IniFileTest, NumericConversions) {
  IniFile ini = IniFile::Parse(kIni);

  auto magnification = ini.GetDouble("GENERAL", "OBJECTIVE_MAGNIFICATION");
  ASSERT_TRUE(magnification.ok()) << magnification.status();
  EXPECT_DOUBLE_EQ(*magnification, 20.5);

  EXPECT_EQ(ini.GetInt("GENERAL", "BROKEN").status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ini.GetDouble("GENERAL", "BROKEN").status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(IniFileTest, MissingEntriesAndFallbacks) {
  IniFile ini = IniFile::Parse(kIni);

  EXPECT_EQ(ini.GetString("MISSING", "KEY").status().code(),
            absl::StatusCode::kNotFound);
  EXPECT_EQ(ini.GetString("GENERAL", "MISSING").status().code(),
            absl::StatusCode::kNotFound);

  auto fallback = ini.GetIntOr("GENERAL", "CameraImageDivisionsPerSide", 1);
  ASSERT_TRUE(fallback.ok()) << fallback.status();
  EXPECT_EQ(*fallback, 1);

  // A present but malformed value is still an error
  EXPECT_FALSE(ini.GetIntOr("GENERAL", "BROKEN", 1).ok());
}

TEST(IniFileTest, LoadFromFile) {
  testutil::TemporaryDirectory temp_dir;
  const fs::path path = temp_dir.Path() / "Slidedat.ini";
  testutil::WriteText(path, kIni);

  auto ini = IniFile::Load(path);
  ASSERT_TRUE(ini.ok()) << ini.status();
  EXPECT_TRUE(ini->HasKey("GENERAL", "SLIDE_ID"));

  auto missing = IniFile::Load(temp_dir.Path() / "missing.ini");
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace slidedat
}  // namespace miraxindex
