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

#include "miraxindex/index/pointer_walker.h"

#include <algorithm>
#include <optional>
#include <utility>

#include "absl/strings/str_format.h"
#include "miraxindex/errors.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/io/binary_utils.h"
#include "miraxindex/io/file_reader.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

namespace {

constexpr int64_t kTupleWords = 4;

/// Number of complete `(x, y, ?, 4)` groups starting at @p first
///
/// With @p visited set, the scan also stops at a group holding a visited word.
int64_t CountTupleGroups(const std::vector<int32_t>& words, int64_t first,
                         const std::vector<bool>* visited) {
  const auto n = static_cast<int64_t>(words.size());
  int64_t groups = 0;
  for (int64_t i = first; i + kTupleWords <= n; i += kTupleWords) {
    if (words[i + 3] != constants::kTupleTypeTag) {
      break;
    }
    if (visited != nullptr &&
        std::any_of(visited->begin() + i, visited->begin() + i + kTupleWords,
                    [](bool v) { return v; })) {
      break;
    }
    ++groups;
  }
  return groups;
}

/// Report a tuple table whose marker sits at @p marker
/// @return Index of the first word after the table
int64_t EmitTupleTable(const std::vector<int32_t>& words, int64_t marker,
                       WalkSink& sink, std::vector<bool>* visited) {
  const int64_t groups = CountTupleGroups(words, marker + 1, visited);

  WalkEvent header;
  header.kind = WalkEventKind::kTupleTable;
  header.index = marker;
  header.value = words[marker];
  header.count = groups;
  sink.OnEvent(header);

  int64_t i = marker + 1;
  for (int64_t g = 0; g < groups; ++g, i += kTupleWords) {
    WalkEvent event;
    event.kind = WalkEventKind::kTuple;
    event.index = i;
    event.tuple =
        TupleGroup{words[i], words[i + 1], words[i + 2], words[i + 3]};
    sink.OnEvent(event);
    if (visited != nullptr) {
      std::fill(visited->begin() + i, visited->begin() + i + kTupleWords,
                true);
    }
  }
  return i;
}

}  // namespace

bool IsPointerCandidate(int64_t value, int64_t header_offset,
                        int64_t num_items) {
  const int64_t rebased = value - header_offset;
  if (rebased % constants::kWordSize != 0) {
    return false;
  }
  const int64_t index = rebased / constants::kWordSize;
  return index >= 0 && index < num_items;
}

WordClass ClassifyWord(int32_t value, int64_t header_offset,
                       int64_t num_items) {
  if (value == 0) {
    return WordClass::kNull;
  }
  if (value == constants::kTupleTableMarker) {
    return WordClass::kTupleMarker;
  }
  if (IsPointerCandidate(value, header_offset, num_items)) {
    return WordClass::kPointer;
  }
  return WordClass::kLiteral;
}

absl::StatusOr<WordStreamSnapshot> WordStreamSnapshot::Load(
    const fs::path& path, int64_t header_offset) {
  FileReader reader;
  ASSIGN_OR_RETURN(
      reader, FileReader::Open(path, "rb"),
      absl::StrFormat("Cannot open index file: %s", path.string()));

  int64_t file_size = 0;
  ASSIGN_OR_RETURN(file_size, reader.GetSize(), "Cannot get index size");
  if (header_offset < 0 || header_offset > file_size) {
    return MAKE_INDEX_ERROR(
        kFormatMismatch,
        absl::StrFormat("Header offset %d does not fit a %d byte file",
                        header_offset, file_size));
  }
  RETURN_IF_ERROR(reader.Seek(header_offset), "Cannot seek to word stream");

  WordStreamSnapshot snapshot;
  snapshot.header_offset_ = header_offset;
  snapshot.words_.reserve(
      static_cast<size_t>((file_size - header_offset) / constants::kWordSize));

  while (true) {
    absl::StatusOr<std::optional<int32_t>> word = TryReadLeInt32(reader);
    if (!word.ok()) {
      if (!IsIndexError(word.status(), IndexErrorKind::kTruncatedRead)) {
        RETURN_IF_ERROR(word.status(), "Cannot read word stream");
      }
      // Partial last word, kept as a finding
      snapshot.trailing_bytes_ = static_cast<size_t>(
          file_size - header_offset -
          snapshot.num_items() * constants::kWordSize);
      break;
    }
    if (!word->has_value()) {
      break;
    }
    snapshot.words_.push_back(**word);
  }

  return snapshot;
}

WordStreamSnapshot WordStreamSnapshot::FromWords(std::vector<int32_t> words,
                                                 int64_t header_offset,
                                                 size_t trailing_bytes) {
  WordStreamSnapshot snapshot;
  snapshot.words_ = std::move(words);
  snapshot.header_offset_ = header_offset;
  snapshot.trailing_bytes_ = trailing_bytes;
  return snapshot;
}

WordClass WordStreamSnapshot::Classify(int64_t index) const {
  return ClassifyWord(words_[index], header_offset_, num_items());
}

int64_t WordStreamSnapshot::TargetIndex(int32_t value) const {
  return (static_cast<int64_t>(value) - header_offset_) /
         constants::kWordSize;
}

void TextWalkSink::OnEvent(const WalkEvent& event) {
  switch (event.kind) {
    case WalkEventKind::kLiteral:
      out_ << absl::StrFormat("%7d %11d\n", event.index, event.value);
      break;
    case WalkEventKind::kPointer:
      out_ << absl::StrFormat(
          "%7d %11d %10d    -> %10s\n", event.index, event.value,
          event.target, absl::StrFormat("%+d", event.target - event.index));
      break;
    case WalkEventKind::kBackReference:
      out_ << absl::StrFormat(
          "%7d %11d %10d    -> %10s  (visited)\n", event.index, event.value,
          event.target, absl::StrFormat("%+d", event.target - event.index));
      break;
    case WalkEventKind::kSkippedZeros:
      out_ << absl::StrFormat("%7s %11s %10s %30d\n", ".", ".", ".",
                              event.count);
      break;
    case WalkEventKind::kTupleTable:
      out_ << absl::StrFormat("%7d %11d    tuple table, %d groups\n",
                              event.index, event.value, event.count);
      break;
    case WalkEventKind::kTuple:
      out_ << absl::StrFormat("%7d %11d %11d %11d %11d\n", event.index,
                              event.tuple.x, event.tuple.y,
                              event.tuple.unknown, event.tuple.tag);
      break;
    case WalkEventKind::kTrailingBytes:
      out_ << absl::StrFormat("%7s %d trailing bytes not decoded\n", "!",
                              event.count);
      break;
    case WalkEventKind::kGraphExhausted:
      out_ << absl::StrFormat("graph exhausted after %d words\n",
                              event.count);
      break;
    case WalkEventKind::kEndOfStream:
      out_ << absl::StrFormat("end of stream, %d words\n", event.count);
      break;
  }
}

size_t CollectingWalkSink::Count(WalkEventKind kind) const {
  return static_cast<size_t>(
      std::count_if(events_.begin(), events_.end(),
                    [kind](const WalkEvent& e) { return e.kind == kind; }));
}

void DumpWords(const WordStreamSnapshot& snapshot, WalkSink& sink) {
  const std::vector<int32_t>& words = snapshot.words();
  const int64_t n = snapshot.num_items();

  int64_t zeros = 0;
  auto flush_zeros = [&](int64_t next_index) {
    if (zeros == 0) {
      return;
    }
    WalkEvent event;
    event.kind = WalkEventKind::kSkippedZeros;
    event.index = next_index - zeros;
    event.count = zeros;
    sink.OnEvent(event);
    zeros = 0;
  };

  int64_t i = 0;
  while (i < n) {
    const WordClass word_class = snapshot.Classify(i);
    if (word_class == WordClass::kNull) {
      ++zeros;
      ++i;
      continue;
    }
    flush_zeros(i);

    if (word_class == WordClass::kTupleMarker) {
      i = EmitTupleTable(words, i, sink, nullptr);
      continue;
    }

    WalkEvent event;
    event.index = i;
    event.value = words[i];
    if (word_class == WordClass::kPointer) {
      event.kind = WalkEventKind::kPointer;
      event.target = snapshot.TargetIndex(words[i]);
    } else {
      event.kind = WalkEventKind::kLiteral;
    }
    sink.OnEvent(event);
    ++i;
  }
  flush_zeros(n);

  if (snapshot.trailing_bytes() > 0) {
    WalkEvent event;
    event.kind = WalkEventKind::kTrailingBytes;
    event.index = n;
    event.count = static_cast<int64_t>(snapshot.trailing_bytes());
    sink.OnEvent(event);
  }

  WalkEvent end;
  end.kind = WalkEventKind::kEndOfStream;
  end.index = n;
  end.count = n;
  sink.OnEvent(end);
}

void WalkGraph(const WordStreamSnapshot& snapshot, int64_t start,
               WalkSink& sink) {
  const std::vector<int32_t>& words = snapshot.words();
  const int64_t n = snapshot.num_items();

  std::vector<bool> visited(static_cast<size_t>(n), false);
  int64_t visited_count = 0;

  // Resume points of runs interrupted by a followed pointer
  std::vector<int64_t> continuations;
  if (start >= 0 && start < n) {
    continuations.push_back(start);
  }

  while (!continuations.empty()) {
    int64_t i = continuations.back();
    continuations.pop_back();

    while (i < n && !visited[i]) {
      const WordClass word_class = snapshot.Classify(i);

      if (word_class == WordClass::kNull) {
        // A zero run terminates the table
        int64_t run = 0;
        while (i + run < n && words[i + run] == 0 && !visited[i + run]) {
          visited[i + run] = true;
          ++run;
        }
        visited_count += run;

        WalkEvent event;
        event.kind = WalkEventKind::kSkippedZeros;
        event.index = i;
        event.count = run;
        sink.OnEvent(event);
        break;
      }

      if (word_class == WordClass::kTupleMarker) {
        visited[i] = true;
        const int64_t next = EmitTupleTable(words, i, sink, &visited);
        visited_count += next - i;
        i = next;
        continue;
      }

      visited[i] = true;
      ++visited_count;

      WalkEvent event;
      event.index = i;
      event.value = words[i];

      if (word_class == WordClass::kLiteral) {
        event.kind = WalkEventKind::kLiteral;
        sink.OnEvent(event);
        ++i;
        continue;
      }

      event.target = snapshot.TargetIndex(words[i]);
      if (visited[event.target]) {
        event.kind = WalkEventKind::kBackReference;
        sink.OnEvent(event);
        ++i;
        continue;
      }

      event.kind = WalkEventKind::kPointer;
      sink.OnEvent(event);
      continuations.push_back(i + 1);
      i = event.target;
    }
  }

  WalkEvent done;
  done.kind = WalkEventKind::kGraphExhausted;
  done.index = start;
  done.count = visited_count;
  sink.OnEvent(done);
}

}  // namespace miraxindex
