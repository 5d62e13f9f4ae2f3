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

#include "miraxindex/io/binary_utils.h"

#include <zlib.h>

#include <cstdint>
#include <optional>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "miraxindex/errors.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {
namespace io {

absl::StatusOr<int32_t> ReadLeInt32(const FileReader& reader) {
  uint8_t buf[4];
  const size_t got = reader.ReadUpTo(buf, sizeof(buf));
  if (got != sizeof(buf)) {
    return MAKE_INDEX_ERROR(
        kTruncatedRead,
        absl::StrFormat("Failed to read 4 bytes for int32 (got %zu)", got));
  }
  return DecodeLeInt32(buf);
}

absl::StatusOr<std::optional<int32_t>> TryReadLeInt32(
    const FileReader& reader) {
  uint8_t buf[4];
  const size_t got = reader.ReadUpTo(buf, sizeof(buf));
  if (got == 0) {
    return std::optional<int32_t>();
  }
  if (got != sizeof(buf)) {
    return MAKE_INDEX_ERROR(
        kTruncatedRead,
        absl::StrFormat("Partial int32 at end of data (%zu of 4 bytes)", got));
  }
  return std::optional<int32_t>(DecodeLeInt32(buf));
}

absl::StatusOr<uint8_t> ReadLeUInt8(const FileReader& reader) {
  uint8_t value = 0;
  if (reader.ReadUpTo(&value, 1) != 1) {
    return MAKE_INDEX_ERROR(kTruncatedRead, "Failed to read 1 byte for uint8");
  }
  return value;
}

absl::StatusOr<std::vector<uint8_t>> DecompressZlib(const uint8_t* data,
                                                    size_t compressed_size,
                                                    size_t expected_size) {
  std::vector<uint8_t> decompressed(expected_size);
  z_stream strm{};
  strm.next_in = const_cast<uint8_t*>(data);
  strm.avail_in = static_cast<uInt>(compressed_size);
  strm.next_out = decompressed.data();
  strm.avail_out = static_cast<uInt>(expected_size);

  if (inflateInit(&strm) != Z_OK) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to initialize zlib");
  }

  int ret = inflate(&strm, Z_FINISH);
  const size_t produced = expected_size - strm.avail_out;
  inflateEnd(&strm);

  if (ret != Z_STREAM_END) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Zlib decompression failed with error code: %d", ret));
  }
  if (produced != expected_size) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Zlib stream inflated to %zu bytes, expected %zu",
                        produced, expected_size));
  }

  return decompressed;
}

}  // namespace io
}  // namespace miraxindex
