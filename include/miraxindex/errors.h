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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_ERRORS_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_ERRORS_H_

#include <cstdint>
#include <optional>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "miraxindex/status/status_macros.h"

/**
 * @file errors.h
 * @brief Index error taxonomy
 *
 * Every failure raised while decoding an index falls into one of four kinds.
 * The kind maps onto a canonical absl::StatusCode and is also attached to the
 * status as a payload, so that it survives any number of RETURN_IF_ERROR /
 * ASSIGN_OR_RETURN wraps:
 *
 * | Kind              | Status code            |
 * |-------------------|------------------------|
 * | kTruncatedRead    | kOutOfRange            |
 * | kInvalidOffset    | kInvalidArgument       |
 * | kCorruptIndex     | kDataLoss              |
 * | kFormatMismatch   | kFailedPrecondition    |
 */

namespace miraxindex {

/// @brief Structured failure kind of an index operation
enum class IndexErrorKind : uint8_t {
  kTruncatedRead,   ///< Fewer bytes available than a decode requires
  kInvalidOffset,   ///< Seek target outside the file
  kCorruptIndex,    ///< A structural invariant of the index is violated
  kFormatMismatch,  ///< Header magic / slide id differs from the descriptor
};

/// @brief Type URL under which the kind is stored on a status
inline constexpr char kIndexErrorKindPayloadUrl[] =
    "type.miraxindex/IndexErrorKind";

/// @brief Human readable name ("TruncatedRead", ...)
absl::string_view IndexErrorKindName(IndexErrorKind kind);

/// @brief Canonical status code for a kind
absl::StatusCode IndexErrorKindCode(IndexErrorKind kind);

/// @brief Build a status of the given kind (code + payload)
absl::Status MakeIndexError(IndexErrorKind kind, absl::string_view message);

/// @brief Recover the kind from a (possibly wrapped) status
/// @return The kind, or std::nullopt for ok statuses and foreign errors
std::optional<IndexErrorKind> GetIndexErrorKind(const absl::Status& status);

/// @brief True if @p status carries exactly @p kind
bool IsIndexError(const absl::Status& status, IndexErrorKind kind);

}  // namespace miraxindex

/// @brief Create a traced index error of the given kind
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_INDEX_ERROR(kind, message)                                      \
  ::miraxindex::status::AddTrace(                                            \
      ::miraxindex::MakeIndexError(::miraxindex::IndexErrorKind::kind,       \
                                   (message)),                               \
      __func__, __FILE__, __LINE__, (message))

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_ERRORS_H_
