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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_POINTER_WALKER_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_POINTER_WALKER_H_

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <vector>

#include "absl/status/statusor.h"

/// @file pointer_walker.h
/// @brief Descriptor-free traversal of the index word stream
///
/// Without Slidedat.ini nothing says which words are pointers. Every word is
/// therefore classified on its value alone:
///
/// | Value                                   | Class        |
/// |-----------------------------------------|--------------|
/// | 0                                       | kNull        |
/// | 128                                     | kTupleMarker |
/// | (v - h) % 4 == 0, 0 <= (v - h)/4 < n    | kPointer     |
/// | anything else                           | kLiteral     |
///
/// with h the header offset and n the number of words. The classification is
/// ambiguous by nature (a count can look like a pointer) and is kept exactly
/// as is. A tuple marker is followed by `(x, y, ?, tag)` groups for as long
/// as tag == 4.
///
/// Nothing here fails on malformed content. Whatever cannot be classified is
/// reported as a literal, and traversals end with an event instead of an
/// error.

namespace fs = std::filesystem;

namespace miraxindex {

/// @brief Classification of one word
enum class WordClass : std::uint8_t {
  kNull,
  kTupleMarker,
  kPointer,
  kLiteral,
};

/// @brief True if @p value addresses a word inside the stream
bool IsPointerCandidate(int64_t value, int64_t header_offset,
                        int64_t num_items);

/// @brief Classify a word (null, then marker, then pointer, else literal)
WordClass ClassifyWord(int32_t value, int64_t header_offset,
                       int64_t num_items);

/// @brief The word stream of an index file, held in memory
class WordStreamSnapshot {
 public:
  WordStreamSnapshot() = default;

  /// @brief Read every complete word after @p header_offset
  ///
  /// A partial word at the end is recorded in trailing_bytes().
  ///
  /// @retval absl::NotFoundError if the file cannot be opened
  /// @retval kFormatMismatch if @p header_offset lies beyond the file
  static absl::StatusOr<WordStreamSnapshot> Load(const fs::path& path,
                                                 int64_t header_offset);

  /// @brief Build a snapshot from words already in memory
  static WordStreamSnapshot FromWords(std::vector<int32_t> words,
                                      int64_t header_offset,
                                      size_t trailing_bytes = 0);

  const std::vector<int32_t>& words() const { return words_; }
  int64_t header_offset() const { return header_offset_; }
  int64_t num_items() const { return static_cast<int64_t>(words_.size()); }
  size_t trailing_bytes() const { return trailing_bytes_; }

  /// @brief Class of the word at @p index
  WordClass Classify(int64_t index) const;

  /// @brief Word index a pointer value refers to
  int64_t TargetIndex(int32_t value) const;

 private:
  std::vector<int32_t> words_;
  int64_t header_offset_ = 0;
  size_t trailing_bytes_ = 0;
};

/// @brief One `(x, y, ?, tag)` group of a tuple table
struct TupleGroup {
  int32_t x = 0;
  int32_t y = 0;
  int32_t unknown = 0;
  int32_t tag = 0;

  bool operator==(const TupleGroup&) const = default;
};

/// @brief What a traversal reports
enum class WalkEventKind : std::uint8_t {
  kLiteral,         ///< index, value
  kPointer,         ///< index, value, target
  kBackReference,   ///< pointer to an already visited word
  kSkippedZeros,    ///< index of the first zero, count
  kTupleTable,      ///< marker index, count of groups
  kTuple,           ///< index of the group, tuple
  kTrailingBytes,   ///< count of bytes after the last complete word
  kGraphExhausted,  ///< graph walk finished, count of visited words
  kEndOfStream,     ///< linear dump finished, count of words
};

/// @brief A single traversal event
struct WalkEvent {
  WalkEventKind kind = WalkEventKind::kLiteral;
  int64_t index = 0;
  int32_t value = 0;
  int64_t target = 0;
  int64_t count = 0;
  TupleGroup tuple;
};

/// @brief Receiver of traversal events
class WalkSink {
 public:
  virtual ~WalkSink() = default;

  virtual void OnEvent(const WalkEvent& event) = 0;
};

/// @brief Renders events as text, one line per event
///
/// Words are printed as `index value [target -> jump]`, zero runs as a single
/// line of dots with the run length.
class TextWalkSink : public WalkSink {
 public:
  explicit TextWalkSink(std::ostream& out) : out_(out) {}

  void OnEvent(const WalkEvent& event) override;

 private:
  std::ostream& out_;
};

/// @brief Keeps all events, for inspection
class CollectingWalkSink : public WalkSink {
 public:
  void OnEvent(const WalkEvent& event) override { events_.push_back(event); }

  const std::vector<WalkEvent>& events() const { return events_; }

  /// @brief Number of events of one kind
  size_t Count(WalkEventKind kind) const;

 private:
  std::vector<WalkEvent> events_;
};

/// @brief Linear scan of the whole stream
///
/// Reports every non-zero word, collapses runs of zeros and decodes tuple
/// tables. Ends with kTrailingBytes (if any) and kEndOfStream.
void DumpWords(const WordStreamSnapshot& snapshot, WalkSink& sink);

/// @brief Depth-first walk of the pointer graph from word @p start
///
/// Each run of words is scanned until a zero. Pointers are followed at once,
/// the remainder of the run is resumed afterwards. Pointers to visited words
/// are reported as back references and not followed, so cycles terminate.
/// Always ends with kGraphExhausted.
void WalkGraph(const WordStreamSnapshot& snapshot, int64_t start,
               WalkSink& sink);

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_INDEX_POINTER_WALKER_H_
