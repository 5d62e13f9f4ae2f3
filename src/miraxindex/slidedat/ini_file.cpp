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

/// @file ini_file.cpp
/// @brief Slidedat.ini parser
///
/// No multi-line values and no quoting; the scanner never writes either.

#include "miraxindex/slidedat/ini_file.h"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {
namespace slidedat {

namespace {

constexpr char kWhitespace[] = " \t\r\n";

std::string Trim(std::string s) {
  s.erase(0, s.find_first_not_of(kWhitespace));
  s.erase(s.find_last_not_of(kWhitespace) + 1);
  return s;
}

std::string NormalizeKey(std::string_view key) {
  return absl::AsciiStrToLower(Trim(std::string(key)));
}

}  // namespace

absl::StatusOr<IniFile> IniFile::Load(const fs::path& path) {
  std::ifstream file{path, std::ios::binary};
  if (!file.is_open()) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("Cannot open file: %s", path.string()));
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  return Parse(contents.str());
}

IniFile IniFile::Parse(std::string_view text) {
  IniFile ini;
  std::string current_section;

  std::istringstream stream{std::string(text)};
  std::string line;
  bool first_line = true;

  while (std::getline(stream, line)) {
    // Remove UTF-8 BOM from first line if present
    if (first_line && line.size() >= 3 &&
        static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB &&
        static_cast<unsigned char>(line[2]) == 0xBF) {
      line = line.substr(3);
    }
    first_line = false;

    line = Trim(std::move(line));
    if (line.empty() || line[0] == ';' || line[0] == '#') {
      continue;
    }

    if (line[0] == '[' && line.back() == ']') {
      current_section = Trim(line.substr(1, line.length() - 2));
      ini.data_[current_section];
      continue;
    }

    const size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      continue;
    }
    ini.data_[current_section][NormalizeKey(line.substr(0, eq_pos))] =
        Trim(line.substr(eq_pos + 1));
  }

  return ini;
}

absl::StatusOr<std::string> IniFile::GetString(std::string_view section,
                                               std::string_view key) const {
  auto section_it = data_.find(std::string(section));
  if (section_it == data_.end()) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("Section not found: %s", section));
  }

  auto key_it = section_it->second.find(NormalizeKey(key));
  if (key_it == section_it->second.end()) {
    return MAKE_STATUS(
        absl::StatusCode::kNotFound,
        absl::StrFormat("Key not found: %s in section %s", key, section));
  }

  return key_it->second;
}

absl::StatusOr<int> IniFile::GetInt(std::string_view section,
                                    std::string_view key) const {
  std::string str_result;
  ASSIGN_OR_RETURN(str_result, GetString(section, key));

  int value = 0;
  if (!absl::SimpleAtoi(str_result, &value)) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Cannot parse integer for key %s in section %s: '%s'",
                        key, section, str_result));
  }
  return value;
}

absl::StatusOr<int> IniFile::GetIntOr(std::string_view section,
                                      std::string_view key,
                                      int fallback) const {
  if (!HasKey(section, key)) {
    return fallback;
  }
  return GetInt(section, key);
}

absl::StatusOr<double> IniFile::GetDouble(std::string_view section,
                                          std::string_view key) const {
  std::string str_result;
  ASSIGN_OR_RETURN(str_result, GetString(section, key));

  double value = 0.0;
  if (!absl::SimpleAtod(str_result, &value)) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Cannot parse double for key %s in section %s: '%s'",
                        key, section, str_result));
  }
  return value;
}

bool IniFile::HasSection(std::string_view section) const {
  return data_.find(std::string(section)) != data_.end();
}

bool IniFile::HasKey(std::string_view section, std::string_view key) const {
  auto section_it = data_.find(std::string(section));
  return section_it != data_.end() &&
         section_it->second.count(NormalizeKey(key)) > 0;
}

}  // namespace slidedat
}  // namespace miraxindex
