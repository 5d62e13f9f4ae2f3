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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDEDAT_INI_FILE_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDEDAT_INI_FILE_H_

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"

namespace fs = std::filesystem;

namespace miraxindex {
namespace slidedat {

/// @brief INI parser for Slidedat.ini
///
/// Handles the dialect written by the scanner software:
/// - UTF-8 BOM at start of file
/// - [SECTION] headers, section names are case sensitive
/// - KEY = VALUE pairs, keys are case insensitive
/// - Comments starting with ; or #
class IniFile {
 public:
  /// @brief Load and parse an INI file
  /// @retval absl::NotFoundError if the file cannot be opened
  static absl::StatusOr<IniFile> Load(const fs::path& path);

  /// @brief Parse INI text held in memory
  static IniFile Parse(std::string_view text);

  /// @brief Get string value from section
  /// @retval absl::NotFoundError if section or key does not exist
  absl::StatusOr<std::string> GetString(std::string_view section,
                                        std::string_view key) const;

  /// @brief Get integer value from section
  /// @retval absl::InvalidArgumentError if the value is not an integer
  absl::StatusOr<int> GetInt(std::string_view section,
                             std::string_view key) const;

  /// @brief Get integer value, or @p fallback if the key is missing
  absl::StatusOr<int> GetIntOr(std::string_view section, std::string_view key,
                               int fallback) const;

  /// @brief Get double value from section
  absl::StatusOr<double> GetDouble(std::string_view section,
                                   std::string_view key) const;

  /// @brief Check if section exists
  bool HasSection(std::string_view section) const;

  /// @brief Check if a key exists in a section
  bool HasKey(std::string_view section, std::string_view key) const;

 private:
  std::map<std::string, std::map<std::string, std::string>> data_;
};

}  // namespace slidedat
}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDEDAT_INI_FILE_H_
