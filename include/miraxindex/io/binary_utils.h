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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_IO_BINARY_UTILS_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_IO_BINARY_UTILS_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "absl/status/statusor.h"
#include "miraxindex/io/file_reader.h"

/**
 * @file binary_utils.h
 * @brief Little-endian primitives and zlib inflation
 *
 * Two read contracts are offered for 32-bit words:
 *
 * - ReadLeInt32() needs all four bytes; anything less is kTruncatedRead.
 * - TryReadLeInt32() separates a clean end of data (no byte available,
 *   std::nullopt) from a partial word (kTruncatedRead). Table scans use it to
 *   stop at end of file without treating that as corruption.
 */

namespace miraxindex {
namespace io {

/// @brief Read a little-endian 32-bit signed integer
/// @retval kTruncatedRead if fewer than 4 bytes remain
absl::StatusOr<int32_t> ReadLeInt32(const FileReader& reader);

/// @brief Read a little-endian 32-bit integer, or report a clean end of data
/// @return The word, std::nullopt if no byte was left, or kTruncatedRead if
///         between 1 and 3 bytes were left
absl::StatusOr<std::optional<int32_t>> TryReadLeInt32(
    const FileReader& reader);

/// @brief Read a single byte
/// @retval kTruncatedRead at end of file
absl::StatusOr<uint8_t> ReadLeUInt8(const FileReader& reader);

/// @brief Decode a little-endian int32 from 4 bytes in memory
inline int32_t DecodeLeInt32(const uint8_t* p) {
  return static_cast<int32_t>(
      static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
      (static_cast<uint32_t>(p[2]) << 16) |
      (static_cast<uint32_t>(p[3]) << 24));
}

/// @brief Append a little-endian int32 to a byte buffer
inline void AppendLeInt32(std::vector<uint8_t>& out, int32_t value) {
  const auto u = static_cast<uint32_t>(value);
  out.push_back(static_cast<uint8_t>(u & 0xFF));
  out.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((u >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((u >> 24) & 0xFF));
}

/// @brief Decompress zlib-compressed data
/// @param data Pointer to compressed data
/// @param compressed_size Size of compressed data in bytes
/// @param expected_size Expected size of decompressed data in bytes
/// @return Decompressed data or error
/// @retval kCorruptIndex if the stream is invalid or inflates to a different
///         size
absl::StatusOr<std::vector<uint8_t>> DecompressZlib(const uint8_t* data,
                                                    size_t compressed_size,
                                                    size_t expected_size);

}  // namespace io

using io::DecodeLeInt32;
using io::DecompressZlib;
using io::ReadLeInt32;
using io::ReadLeUInt8;
using io::TryReadLeInt32;

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_IO_BINARY_UTILS_H_
