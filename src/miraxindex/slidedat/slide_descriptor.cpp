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

#include "miraxindex/slidedat/slide_descriptor.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {
namespace slidedat {

namespace {

constexpr std::string_view kMrxsExt = ".mrxs";
constexpr std::string_view kSlidedatIni = "Slidedat.ini";

constexpr std::string_view kGroupGeneral = "GENERAL";
constexpr std::string_view kKeySlideVersion = "SLIDE_VERSION";
constexpr std::string_view kKeySlideId = "SLIDE_ID";
constexpr std::string_view kKeySlideType = "SLIDE_TYPE";
constexpr std::string_view kKeyImageNumberX = "IMAGENUMBER_X";
constexpr std::string_view kKeyImageNumberY = "IMAGENUMBER_Y";
constexpr std::string_view kKeyCameraImageDivisionsPerSide =
    "CameraImageDivisionsPerSide";

constexpr std::string_view kGroupHierarchical = "HIERARCHICAL";
constexpr std::string_view kKeyHierCount = "HIER_COUNT";
constexpr std::string_view kKeyNonHierCount = "NONHIER_COUNT";
constexpr std::string_view kKeyIndexFile = "INDEXFILE";
constexpr std::string_view kValueSlideZoomLevel = "Slide zoom level";

constexpr std::string_view kGroupDatafile = "DATAFILE";
constexpr std::string_view kKeyFileCount = "FILE_COUNT";

constexpr std::string_view kKeyOverlapX = "OVERLAP_X";
constexpr std::string_view kKeyOverlapY = "OVERLAP_Y";
constexpr std::string_view kKeyImageFillColorBgr = "IMAGE_FILL_COLOR_BGR";
constexpr std::string_view kKeyDigitizerWidth = "DIGITIZER_WIDTH";
constexpr std::string_view kKeyDigitizerHeight = "DIGITIZER_HEIGHT";
constexpr std::string_view kKeyImageConcatFactor = "IMAGE_CONCAT_FACTOR";

constexpr std::string_view kPositionBufferLayer = "VIMSLIDE_POSITION_BUFFER";
constexpr std::string_view kStitchingIntensityLayer = "StitchingIntensityLayer";
constexpr std::string_view kPositionDefaultValue = "default";
constexpr std::string_view kKeyPositionFormatVersion =
    "VIMSLIDE_POSITION_DATA_FORMAT_VERSION";

/// Optional string: missing keys give an empty string
std::string GetStringOrEmpty(const IniFile& ini, std::string_view section,
                             std::string_view key) {
  if (!ini.HasKey(section, key)) {
    return {};
  }
  auto value = ini.GetString(section, key);
  return value.ok() ? *value : std::string();
}

/// Parse one family of layers; record numbers run on across its layers
absl::StatusOr<std::vector<DescriptorLayer>> ParseLayers(const IniFile& ini,
                                                         bool hierarchical) {
  const char* prefix = hierarchical ? "HIER" : "NONHIER";
  const std::string_view count_key =
      hierarchical ? kKeyHierCount : kKeyNonHierCount;

  std::vector<DescriptorLayer> layers;
  if (!ini.HasKey(kGroupHierarchical, count_key)) {
    if (hierarchical) {
      return MAKE_STATUS(
          absl::StatusCode::kNotFound,
          absl::StrFormat("Missing key %s in section %s", count_key,
                          kGroupHierarchical));
    }
    return layers;
  }

  int layer_count = 0;
  ASSIGN_OR_RETURN(layer_count, ini.GetInt(kGroupHierarchical, count_key));

  int next_record = 0;
  for (int i = 0; i < layer_count; ++i) {
    DescriptorLayer layer;
    ASSIGN_OR_RETURN(
        layer.name,
        ini.GetString(kGroupHierarchical,
                      absl::StrFormat("%s_%d_NAME", prefix, i)),
        absl::StrFormat("Missing name of %s layer %d", prefix, i));
    layer.section = GetStringOrEmpty(
        ini, kGroupHierarchical, absl::StrFormat("%s_%d_SECTION", prefix, i));

    int level_count = 0;
    ASSIGN_OR_RETURN(level_count,
                     ini.GetInt(kGroupHierarchical,
                                absl::StrFormat("%s_%d_COUNT", prefix, i)),
                     absl::StrFormat("Missing count of layer %s", layer.name));

    for (int j = 0; j < level_count; ++j) {
      DescriptorLevel level;
      level.name = GetStringOrEmpty(
          ini, kGroupHierarchical,
          absl::StrFormat("%s_%d_VAL_%d", prefix, i, j));
      level.section = GetStringOrEmpty(
          ini, kGroupHierarchical,
          absl::StrFormat("%s_%d_VAL_%d_SECTION", prefix, i, j));
      level.record = next_record++;
      layer.levels.push_back(std::move(level));
    }
    layers.push_back(std::move(layer));
  }

  return layers;
}

absl::StatusOr<ZoomLevel> ParseZoomLevel(const IniFile& ini,
                                         const std::string& section) {
  ZoomLevel level;
  level.section = section;
  ASSIGN_OR_RETURN(level.concat_factor,
                   ini.GetIntOr(section, kKeyImageConcatFactor, 0));
  ASSIGN_OR_RETURN(level.tile_width, ini.GetInt(section, kKeyDigitizerWidth));
  ASSIGN_OR_RETURN(level.tile_height,
                   ini.GetInt(section, kKeyDigitizerHeight));
  ASSIGN_OR_RETURN(level.overlap_x, ini.GetDouble(section, kKeyOverlapX));
  ASSIGN_OR_RETURN(level.overlap_y, ini.GetDouble(section, kKeyOverlapY));

  if (ini.HasKey(section, kKeyImageFillColorBgr)) {
    int fill = 0;
    ASSIGN_OR_RETURN(fill, ini.GetInt(section, kKeyImageFillColorBgr));
    level.background_rgb = BgrToRgb(static_cast<uint32_t>(fill));
  }
  return level;
}

}  // namespace

const DescriptorLevel* DescriptorLayer::FindLevel(
    std::string_view level_name) const {
  for (const DescriptorLevel& level : levels) {
    if (level.name == level_name) {
      return &level;
    }
  }
  return nullptr;
}

uint32_t BgrToRgb(uint32_t bgr) {
  const uint32_t swapped = ((bgr & 0x000000FFu) << 24) |
                           ((bgr & 0x0000FF00u) << 8) |
                           ((bgr & 0x00FF0000u) >> 8) |
                           ((bgr & 0xFF000000u) >> 24);
  return swapped >> 8;
}

absl::StatusOr<SlideDescriptor> SlideDescriptor::Load(
    const fs::path& slide_path) {
  fs::path dirname;
  if (slide_path.extension() == kMrxsExt) {
    dirname = slide_path.parent_path() / slide_path.stem();
  } else if (fs::is_directory(slide_path)) {
    dirname = slide_path;
  } else {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Not a MIRAX file: %s", slide_path.string()));
  }

  IniFile ini;
  ASSIGN_OR_RETURN(ini, IniFile::Load(dirname / kSlidedatIni),
                   "Failed to load Slidedat.ini");

  SlideDescriptor descriptor;
  ASSIGN_OR_RETURN(descriptor, FromIni(ini, dirname),
                   absl::StrFormat("Invalid descriptor in %s",
                                   dirname.string()));
  return descriptor;
}

absl::StatusOr<SlideDescriptor> SlideDescriptor::FromIni(
    const IniFile& ini, const fs::path& dirname) {
  SlideDescriptor d;
  d.dirname = dirname;

  if (!ini.HasSection(kGroupGeneral)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("Missing section: %s", kGroupGeneral));
  }
  ASSIGN_OR_RETURN(d.slide_version,
                   ini.GetString(kGroupGeneral, kKeySlideVersion));
  ASSIGN_OR_RETURN(d.slide_id, ini.GetString(kGroupGeneral, kKeySlideId));
  if (ini.HasKey(kGroupGeneral, kKeySlideType)) {
    ASSIGN_OR_RETURN(d.slide_type, ini.GetString(kGroupGeneral, kKeySlideType));
  }
  ASSIGN_OR_RETURN(d.tiles_x, ini.GetInt(kGroupGeneral, kKeyImageNumberX));
  ASSIGN_OR_RETURN(d.tiles_y, ini.GetInt(kGroupGeneral, kKeyImageNumberY));
  ASSIGN_OR_RETURN(
      d.image_divisions,
      ini.GetIntOr(kGroupGeneral, kKeyCameraImageDivisionsPerSide, 1));
  if (d.tiles_x < 1 || d.tiles_y < 1 || d.image_divisions < 1) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Invalid grid %dx%d with %d divisions", d.tiles_x,
                        d.tiles_y, d.image_divisions));
  }

  // Data files
  int file_count = 0;
  ASSIGN_OR_RETURN(file_count, ini.GetInt(kGroupDatafile, kKeyFileCount));
  for (int i = 0; i < file_count; ++i) {
    std::string file;
    ASSIGN_OR_RETURN(file,
                     ini.GetString(kGroupDatafile,
                                   absl::StrFormat("FILE_%d", i)));
    d.datafiles.push_back(std::move(file));
  }

  // Both record tables
  ASSIGN_OR_RETURN(d.index_filename,
                   ini.GetString(kGroupHierarchical, kKeyIndexFile));
  ASSIGN_OR_RETURN(d.hier_layers, ParseLayers(ini, true),
                   "Failed to parse hierarchical layers");
  ASSIGN_OR_RETURN(d.nonhier_layers, ParseLayers(ini, false),
                   "Failed to parse non-hierarchical layers");

  // Zoom levels
  bool found_zoom_layer = false;
  for (size_t i = 0; i < d.hier_layers.size(); ++i) {
    if (d.hier_layers[i].name == kValueSlideZoomLevel) {
      d.slide_zoom_layer = i;
      found_zoom_layer = true;
      break;
    }
  }
  if (!found_zoom_layer) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "Cannot find slide zoom level");
  }
  for (const DescriptorLevel& level : d.SlideZoomLayer().levels) {
    ZoomLevel zoom;
    ASSIGN_OR_RETURN(zoom, ParseZoomLevel(ini, level.section),
                     absl::StrFormat("Zoom level section %s", level.section));
    d.zoom_levels.push_back(std::move(zoom));
  }

  // Position map
  for (const DescriptorLayer& layer : d.nonhier_layers) {
    const bool buffer = layer.name == kPositionBufferLayer;
    const bool stitching = layer.name == kStitchingIntensityLayer;
    if ((!buffer && !stitching) || layer.levels.empty()) {
      continue;
    }

    PositionLayer position;
    position.layer_name = layer.name;
    position.compressed = stitching;
    const DescriptorLevel* level = layer.FindLevel(kPositionDefaultValue);
    position.record =
        level != nullptr ? level->record : layer.levels.front().record;
    if (!layer.section.empty() &&
        ini.HasKey(layer.section, kKeyPositionFormatVersion)) {
      position.format_version =
          GetStringOrEmpty(ini, layer.section, kKeyPositionFormatVersion);
    }
    d.position_layer = std::move(position);
    break;
  }
  if (!d.position_layer.has_value()) {
    LOG(INFO) << "Slide " << d.slide_id << " has no position map";
  }

  return d;
}

IndexLayout SlideDescriptor::Layout() const {
  IndexLayout layout;
  layout.slide_id = slide_id;
  return layout;
}

std::vector<fs::path> SlideDescriptor::DataFilePaths() const {
  std::vector<fs::path> paths;
  paths.reserve(datafiles.size());
  for (const std::string& file : datafiles) {
    paths.push_back(dirname / file);
  }
  return paths;
}

const DescriptorLayer* SlideDescriptor::FindHierLayer(
    std::string_view name) const {
  for (const DescriptorLayer& layer : hier_layers) {
    if (layer.name == name) {
      return &layer;
    }
  }
  return nullptr;
}

const DescriptorLayer* SlideDescriptor::FindNonHierLayer(
    std::string_view name) const {
  for (const DescriptorLayer& layer : nonhier_layers) {
    if (layer.name == name) {
      return &layer;
    }
  }
  return nullptr;
}

const DescriptorLayer& SlideDescriptor::SlideZoomLayer() const {
  return hier_layers[slide_zoom_layer];
}

}  // namespace slidedat
}  // namespace miraxindex
