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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_REPORT_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_REPORT_H_

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/str_cat.h"

/// @file report.h
/// @brief Structured, redirectable slide reports
///
/// A Reporter produces a tree of `key: value` fields and named sections. What
/// happens to them is up to the ReportSink: print them, log them, or keep
/// them for a test to inspect.

namespace miraxindex {

/// @brief One line of a report
struct ReportEntry {
  int depth = 0;
  std::string key;
  std::string value;
  bool is_section = false;  ///< Section header, value is empty
};

/// @brief Receiver of report entries
class ReportSink {
 public:
  virtual ~ReportSink() = default;

  virtual void OnEntry(const ReportEntry& entry) = 0;
};

/// @brief Format an entry as an indented text line (without newline)
std::string FormatReportEntry(const ReportEntry& entry);

/// @brief Writes entries as indented text
class TextReportSink : public ReportSink {
 public:
  explicit TextReportSink(std::ostream& out) : out_(out) {}

  void OnEntry(const ReportEntry& entry) override;

 private:
  std::ostream& out_;
};

/// @brief Writes entries to the INFO log
class LogReportSink : public ReportSink {
 public:
  void OnEntry(const ReportEntry& entry) override;
};

/// @brief Keeps entries for inspection
class CollectingReportSink : public ReportSink {
 public:
  void OnEntry(const ReportEntry& entry) override {
    entries_.push_back(entry);
  }

  const std::vector<ReportEntry>& entries() const { return entries_; }

  /// @brief Value of the first field named @p key, empty if there is none
  std::string Find(std::string_view key) const;

 private:
  std::vector<ReportEntry> entries_;
};

/// @brief Emits fields and sections at one nesting depth
class Reporter {
 public:
  explicit Reporter(ReportSink& sink, int depth = 0)
      : sink_(&sink), depth_(depth) {}

  /// @brief Report `key: value`
  void Field(std::string_view key, const absl::AlphaNum& value) const;

  /// @brief Open a section and return a reporter for its contents
  Reporter Child(std::string_view description) const;

  int depth() const { return depth_; }

 private:
  ReportSink* sink_;
  int depth_;
};

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_REPORT_H_
