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

#include <optional>
#include <string>

#include "absl/strings/cord.h"
#include "absl/types/optional.h"

namespace miraxindex {

absl::string_view IndexErrorKindName(IndexErrorKind kind) {
  switch (kind) {
    case IndexErrorKind::kTruncatedRead:
      return "TruncatedRead";
    case IndexErrorKind::kInvalidOffset:
      return "InvalidOffset";
    case IndexErrorKind::kCorruptIndex:
      return "CorruptIndex";
    case IndexErrorKind::kFormatMismatch:
      return "FormatMismatch";
  }
  return "Unknown";
}

absl::StatusCode IndexErrorKindCode(IndexErrorKind kind) {
  switch (kind) {
    case IndexErrorKind::kTruncatedRead:
      return absl::StatusCode::kOutOfRange;
    case IndexErrorKind::kInvalidOffset:
      return absl::StatusCode::kInvalidArgument;
    case IndexErrorKind::kCorruptIndex:
      return absl::StatusCode::kDataLoss;
    case IndexErrorKind::kFormatMismatch:
      return absl::StatusCode::kFailedPrecondition;
  }
  return absl::StatusCode::kUnknown;
}

absl::Status MakeIndexError(IndexErrorKind kind, absl::string_view message) {
  absl::Status status(IndexErrorKindCode(kind), message);
  status.SetPayload(kIndexErrorKindPayloadUrl,
                    absl::Cord(IndexErrorKindName(kind)));
  return status;
}

std::optional<IndexErrorKind> GetIndexErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  absl::optional<absl::Cord> payload =
      status.GetPayload(kIndexErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }

  const std::string name(*payload);
  for (IndexErrorKind kind :
       {IndexErrorKind::kTruncatedRead, IndexErrorKind::kInvalidOffset,
        IndexErrorKind::kCorruptIndex, IndexErrorKind::kFormatMismatch}) {
    if (name == IndexErrorKindName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

bool IsIndexError(const absl::Status& status, IndexErrorKind kind) {
  auto found = GetIndexErrorKind(status);
  return found.has_value() && *found == kind;
}

}  // namespace miraxindex
