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

#include "absl/log/log.h"
#include "absl/strings/str_format.h"

namespace miraxindex {

std::string FormatReportEntry(const ReportEntry& entry) {
  const std::string indent(static_cast<size_t>(entry.depth) * 2, ' ');
  if (entry.is_section) {
    return absl::StrFormat("%s%s:", indent, entry.key);
  }
  return absl::StrFormat("%s%-30s %s", indent, entry.key + ":", entry.value);
}

void TextReportSink::OnEntry(const ReportEntry& entry) {
  out_ << FormatReportEntry(entry) << '\n';
}

void LogReportSink::OnEntry(const ReportEntry& entry) {
  LOG(INFO) << FormatReportEntry(entry);
}

std::string CollectingReportSink::Find(std::string_view key) const {
  for (const ReportEntry& entry : entries_) {
    if (!entry.is_section && entry.key == key) {
      return entry.value;
    }
  }
  return {};
}

void Reporter::Field(std::string_view key, const absl::AlphaNum& value) const {
  ReportEntry entry;
  entry.depth = depth_;
  entry.key = std::string(key);
  entry.value = std::string(value.Piece());
  sink_->OnEntry(entry);
}

Reporter Reporter::Child(std::string_view description) const {
  ReportEntry entry;
  entry.depth = depth_;
  entry.key = std::string(description);
  entry.is_section = true;
  sink_->OnEntry(entry);
  return Reporter(*sink_, depth_ + 1);
}

}  // namespace miraxindex
