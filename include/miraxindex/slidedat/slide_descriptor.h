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

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDEDAT_SLIDE_DESCRIPTOR_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDEDAT_SLIDE_DESCRIPTOR_H_

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "miraxindex/index/index_types.h"
#include "miraxindex/slidedat/ini_file.h"

/// @file slide_descriptor.h
/// @brief The parts of Slidedat.ini needed to navigate an index
///
/// A slide `foo.mrxs` keeps its files in the directory `foo/`:
/// Slidedat.ini, the index file and the data files. The descriptor names the
/// records of both index tables. Record numbers are flat: they count levels
/// (values) over all layers in descriptor order.

namespace fs = std::filesystem;

namespace miraxindex {
namespace slidedat {

/// @brief One level (hierarchical) or value (non-hierarchical) of a layer
struct DescriptorLevel {
  std::string name;     ///< HIER_i_VAL_j / NONHIER_i_VAL_j
  std::string section;  ///< Section holding the level parameters
  int record = 0;       ///< Slot in the index table
};

/// @brief One hierarchical or non-hierarchical layer
struct DescriptorLayer {
  std::string name;
  std::string section;
  std::vector<DescriptorLevel> levels;

  /// @brief Level by name, nullptr if there is none
  const DescriptorLevel* FindLevel(std::string_view level_name) const;
};

/// @brief Parameters of one level of the "Slide zoom level" layer
struct ZoomLevel {
  std::string section;
  int concat_factor = 0;          ///< IMAGE_CONCAT_FACTOR
  int tile_width = 0;             ///< DIGITIZER_WIDTH
  int tile_height = 0;            ///< DIGITIZER_HEIGHT
  double overlap_x = 0.0;         ///< OVERLAP_X
  double overlap_y = 0.0;         ///< OVERLAP_Y
  uint32_t background_rgb = 0xFFFFFF;  ///< IMAGE_FILL_COLOR_BGR as RGB
};

/// @brief Where the tile position map is stored
struct PositionLayer {
  std::string layer_name;
  int record = -1;
  /// StitchingIntensityLayer maps are zlib compressed
  bool compressed = false;
  /// VIMSLIDE_POSITION_DATA_FORMAT_VERSION, if given
  std::optional<std::string> format_version;
};

/// @brief Convert an IMAGE_FILL_COLOR_BGR value to 0xRRGGBB
uint32_t BgrToRgb(uint32_t bgr);

/// @brief Parsed Slidedat.ini
struct SlideDescriptor {
  fs::path dirname;  ///< Directory holding Slidedat.ini and the data

  std::string slide_version;
  std::string slide_id;
  std::string slide_type = "unknown";
  int tiles_x = 0;
  int tiles_y = 0;
  int image_divisions = 1;

  std::vector<std::string> datafiles;  ///< Relative to dirname
  std::string index_filename;

  std::vector<DescriptorLayer> hier_layers;
  std::vector<DescriptorLayer> nonhier_layers;
  size_t slide_zoom_layer = 0;         ///< Index into hier_layers
  std::vector<ZoomLevel> zoom_levels;  ///< Of the "Slide zoom level" layer
  std::optional<PositionLayer> position_layer;

  /// @brief Load from `<slide>.mrxs` or from the slide directory
  /// @retval absl::InvalidArgumentError if @p slide_path is neither
  /// @retval absl::NotFoundError if Slidedat.ini or a required key is missing
  static absl::StatusOr<SlideDescriptor> Load(const fs::path& slide_path);

  /// @brief Build from an already parsed INI file
  static absl::StatusOr<SlideDescriptor> FromIni(const IniFile& ini,
                                                 const fs::path& dirname);

  /// @brief Header expected at the start of the index file
  IndexLayout Layout() const;

  fs::path IndexPath() const { return dirname / index_filename; }

  /// @brief Full paths of the data files, by file number
  std::vector<fs::path> DataFilePaths() const;

  const DescriptorLayer* FindHierLayer(std::string_view name) const;
  const DescriptorLayer* FindNonHierLayer(std::string_view name) const;

  /// @brief The "Slide zoom level" layer (always present after loading)
  const DescriptorLayer& SlideZoomLayer() const;
};

}  // namespace slidedat

using slidedat::SlideDescriptor;

}  // namespace miraxindex

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_SLIDEDAT_SLIDE_DESCRIPTOR_H_
