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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_TESTING_SYNTHETIC_SLIDE_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_TESTING_SYNTHETIC_SLIDE_H_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "miraxindex/index/index_types.h"
#include "miraxindex/index/index_writer.h"
#include "miraxindex/index/position_map.h"
#include "miraxindex/testing/temporary.h"

namespace fs = std::filesystem;

namespace miraxindex::testutil {

/// @brief Slidedat.ini of the synthetic slide
///
/// 4 x 2 tiles, 2 divisions per side, two zoom levels, a scan data layer
/// with macro and thumbnail (no label) and an uncompressed position buffer.
/// Starts with a UTF-8 BOM like the scanner output.
inline constexpr std::string_view kSyntheticSlidedat =
    "\xEF\xBB\xBF[GENERAL]\n"
    "SLIDE_VERSION = 1.9\n"
    "SLIDE_ID = abc123\n"
    "SLIDE_TYPE = Brightfield\n"
    "IMAGENUMBER_X = 4\n"
    "IMAGENUMBER_Y = 2\n"
    "CameraImageDivisionsPerSide = 2\n"
    "\n"
    "; record tables\n"
    "[HIERARCHICAL]\n"
    "HIER_COUNT = 1\n"
    "HIER_0_NAME = Slide zoom level\n"
    "HIER_0_COUNT = 2\n"
    "HIER_0_VAL_0 = ZoomLevel_0\n"
    "HIER_0_VAL_0_SECTION = LAYER_0_LEVEL_0_SECTION\n"
    "HIER_0_VAL_1 = ZoomLevel_1\n"
    "HIER_0_VAL_1_SECTION = LAYER_0_LEVEL_1_SECTION\n"
    "NONHIER_COUNT = 2\n"
    "NONHIER_0_NAME = Scan data layer\n"
    "NONHIER_0_COUNT = 3\n"
    "NONHIER_0_VAL_0 = ScanDataLayer_SlideThumbnail\n"
    "NONHIER_0_VAL_1 = ScanDataLayer_SlideBarcode\n"
    "NONHIER_0_VAL_2 = ScanDataLayer_SlidePreview\n"
    "NONHIER_1_NAME = VIMSLIDE_POSITION_BUFFER\n"
    "NONHIER_1_SECTION = NONHIER_1_SECTION\n"
    "NONHIER_1_COUNT = 1\n"
    "NONHIER_1_VAL_0 = default\n"
    "INDEXFILE = Index.dat\n"
    "\n"
    "[DATAFILE]\n"
    "FILE_COUNT = 1\n"
    "FILE_0 = Data0000.dat\n"
    "\n"
    "[LAYER_0_LEVEL_0_SECTION]\n"
    "OVERLAP_X = 1.5\n"
    "OVERLAP_Y = 2\n"
    "IMAGE_FILL_COLOR_BGR = 16711680\n"
    "DIGITIZER_WIDTH = 256\n"
    "DIGITIZER_HEIGHT = 128\n"
    "\n"
    "[LAYER_0_LEVEL_1_SECTION]\n"
    "OVERLAP_X = 0\n"
    "OVERLAP_Y = 0\n"
    "IMAGE_CONCAT_FACTOR = 1\n"
    "DIGITIZER_WIDTH = 256\n"
    "DIGITIZER_HEIGHT = 128\n"
    "\n"
    "[NONHIER_1_SECTION]\n"
    "VIMSLIDE_POSITION_DATA_FORMAT_VERSION = 1\n";

/// @brief Blobs stored in Data0000.dat of the synthetic slide
struct SyntheticBlobs {
  DataLocation macro{0, 0, 5};
  DataLocation thumbnail{0, 5, 5};
  DataLocation position_map{0, 10, 18};
  HierRecord tile_0{0, 28, 4, 0};
  HierRecord tile_5{5, 32, 4, 0};
  HierRecord level_1_tile_0{0, 36, 4, 0};
};

/// @brief Write a complete synthetic slide below @p root
///
/// Lays out `<root>/slide.mrxs` and `<root>/slide/` holding Slidedat.ini,
/// Index.dat and Data0000.dat.
/// @return Path of the .mrxs file
inline fs::path WriteSyntheticSlide(const fs::path& root) {
  const SyntheticBlobs blobs;
  const fs::path dir = root / "slide";
  fs::create_directories(dir);

  WriteText(root / "slide.mrxs", "");
  WriteText(dir / "Slidedat.ini", kSyntheticSlidedat);

  // Image 1 of the 2 x 1 position grid is moved by (1.0, -0.5) pixels
  const std::vector<uint8_t> position_map =
      EncodePositionMap({{0, 0, 0}, {1, 256, -128}});

  std::string data = "MACROTHUMB";
  data.append(position_map.begin(), position_map.end());
  data.append("JPG0JPG5JPGL");
  WriteText(dir / "Data0000.dat", data);

  IndexLayout layout;
  layout.slide_id = "abc123";
  IndexWriter writer(layout);
  writer.AddLevel({{blobs.tile_0, blobs.tile_5}});
  writer.AddLevel({{blobs.level_1_tile_0}});
  writer.AddNonHierRecord(blobs.macro);
  writer.AddNonHierRecord(std::nullopt);
  writer.AddNonHierRecord(blobs.thumbnail);
  writer.AddNonHierRecord(blobs.position_map);
  auto index = writer.Build();
  if (!index.ok()) {
    throw std::runtime_error("Failed to encode synthetic index: " +
                             std::string(index.status().message()));
  }
  WriteBytes(dir / "Index.dat", *index);

  return root / "slide.mrxs";
}

}  // namespace miraxindex::testutil

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_TESTING_SYNTHETIC_SLIDE_H_
