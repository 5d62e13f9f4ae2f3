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

#include "miraxindex/slide_dump.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "miraxindex/errors.h"
#include "miraxindex/index/hier_decoder.h"
#include "miraxindex/index/position_map.h"
#include "miraxindex/io/file_reader.h"
#include "miraxindex/status/status_macros.h"

namespace miraxindex {

namespace {

constexpr std::string_view kScanDataLayer = "Scan data layer";

/// Associated image name and its value in the scan data layer
constexpr std::pair<std::string_view, std::string_view> kAssociatedImages[] = {
    {"macro", "ScanDataLayer_SlideThumbnail"},
    {"label", "ScanDataLayer_SlideBarcode"},
    {"thumbnail", "ScanDataLayer_SlidePreview"},
};

absl::StatusOr<std::string> DataFileName(const SlideDescriptor& descriptor,
                                         int32_t file_number) {
  if (file_number < 0 ||
      file_number >= static_cast<int32_t>(descriptor.datafiles.size())) {
    return MAKE_INDEX_ERROR(
        kCorruptIndex,
        absl::StrFormat("Invalid file number: %d (slide has %zu data files)",
                        file_number, descriptor.datafiles.size()));
  }
  return fs::path(descriptor.datafiles[file_number]).filename().string();
}

/// Report one non-hierarchical record and return its location
absl::StatusOr<std::optional<DataLocation>> ReportNonHierRecord(
    const Reporter& r, const SlideDescriptor& descriptor,
    const MrxsIndexReader& reader, const DataFileSet& files, int record) {
  r.Field("Nonhier record", record);

  std::optional<DataLocation> location;
  ASSIGN_OR_RETURN(location, reader.ReadNonHierRecord(record));
  if (!location.has_value()) {
    r.Field("File", "None");
    return location;
  }

  std::string file;
  ASSIGN_OR_RETURN(file, DataFileName(descriptor, location->file_number));
  RETURN_IF_ERROR(files.Validate(*location),
                  absl::StrFormat("Non-hierarchical record %d", record));
  r.Field("File", file);
  r.Field("Position", location->offset);
  r.Field("Length", location->length);
  return location;
}

void ReportZoomLevel(const Reporter& r, const slidedat::ZoomLevel& level) {
  r.Field("Concat factor", level.concat_factor);
  r.Field("Tile width", level.tile_width);
  r.Field("Tile height", level.tile_height);
  r.Field("Overlap X", level.overlap_x);
  r.Field("Overlap Y", level.overlap_y);
  r.Field("Background", absl::StrFormat("%x", level.background_rgb));
}

absl::Status ReportTilePositions(const Reporter& r,
                                 const SlideDescriptor& descriptor,
                                 const MrxsIndexReader& reader,
                                 const DataFileSet& files) {
  const slidedat::PositionLayer& layer = *descriptor.position_layer;

  std::optional<DataLocation> location;
  ASSIGN_OR_RETURN(
      location, ReportNonHierRecord(r, descriptor, reader, files, layer.record),
      "Position map record");
  if (!location.has_value()) {
    return absl::OkStatus();
  }

  std::vector<uint8_t> bytes;
  ASSIGN_OR_RETURN(bytes, files.ReadBlob(*location),
                   "Failed to read position map");

  const int32_t images_x = descriptor.tiles_x / descriptor.image_divisions;
  const int32_t images_y = descriptor.tiles_y / descriptor.image_divisions;
  if (layer.compressed) {
    ASSIGN_OR_RETURN(bytes,
                     InflatePositionLayer(std::move(bytes),
                                          static_cast<int64_t>(images_x) *
                                              images_y),
                     "Failed to inflate position map");
  }

  std::vector<PositionRefinement> refinements;
  ASSIGN_OR_RETURN(refinements,
                   DecodePositionMap(bytes, images_x,
                                     descriptor.image_divisions),
                   "Failed to decode position map");
  for (const PositionRefinement& p : refinements) {
    r.Field(absl::StrFormat("Tile %5d x %5d", p.grid.x, p.grid.y),
            absl::StrFormat("%8d x %8d  (%3d)", p.raw_x, p.raw_y, p.flag));
  }
  return absl::OkStatus();
}

absl::Status WriteFile(const fs::path& path,
                       const std::vector<uint8_t>& data) {
  FileReader out;
  ASSIGN_OR_RETURN(out, FileReader::Open(path, "wb"),
                   absl::StrFormat("Cannot create %s", path.string()));
  RETURN_IF_ERROR(out.Write(data.data(), data.size()),
                  absl::StrFormat("Cannot write %s", path.string()));
  return absl::OkStatus();
}

}  // namespace

absl::Status DumpSlide(const fs::path& slide_path, const Reporter& r) {
  SlideDescriptor descriptor;
  ASSIGN_OR_RETURN(descriptor, SlideDescriptor::Load(slide_path));

  r.Field("Slide version", descriptor.slide_version);
  r.Field("Slide ID", descriptor.slide_id);
  r.Field("Slide type", descriptor.slide_type);
  r.Field("Tiles in X", descriptor.tiles_x);
  r.Field("Tiles in Y", descriptor.tiles_y);
  r.Field("Image divisions per side", descriptor.image_divisions);
  if (descriptor.position_layer.has_value() &&
      descriptor.position_layer->format_version.has_value()) {
    r.Field("Position map ver", *descriptor.position_layer->format_version);
  }

  MrxsIndexReader reader;
  ASSIGN_OR_RETURN(reader, MrxsIndexReader::Open(descriptor.IndexPath(),
                                                 descriptor.Layout()));
  r.Field("Index version", reader.layout().version);
  r.Field("Index ID", reader.layout().slide_id);

  const DataFileSet files(descriptor.DataFilePaths());

  // Associated images (may be missing)
  {
    const Reporter images = r.Child("Associated images");
    const slidedat::DescriptorLayer* scan_layer =
        descriptor.FindNonHierLayer(kScanDataLayer);
    for (const auto& [name, value] : kAssociatedImages) {
      const slidedat::DescriptorLevel* level =
          scan_layer != nullptr ? scan_layer->FindLevel(value) : nullptr;
      if (level == nullptr) {
        continue;
      }
      std::optional<DataLocation> location;
      ASSIGN_OR_RETURN(location,
                       ReportNonHierRecord(images.Child(name), descriptor,
                                           reader, files, level->record),
                       absl::StrFormat("Associated image %s", name));
    }
  }

  {
    const Reporter zoom = r.Child("Zoom levels");
    for (size_t i = 0; i < descriptor.zoom_levels.size(); ++i) {
      ReportZoomLevel(zoom.Child(absl::StrFormat("Level %d", i)),
                      descriptor.zoom_levels[i]);
    }
  }

  if (descriptor.position_layer.has_value()) {
    RETURN_IF_ERROR(ReportTilePositions(r.Child("Tile positions"), descriptor,
                                        reader, files),
                    "Failed to report tile positions");
  } else {
    r.Field("Tile positions", "None");
  }

  const Reporter tiles = r.Child("Tiles");
  const slidedat::DescriptorLayer& zoom_layer = descriptor.SlideZoomLayer();
  for (size_t i = 0; i < zoom_layer.levels.size(); ++i) {
    const Reporter level = tiles.Child(absl::StrFormat("Level %d", i));

    std::vector<HierRecord> records;
    ASSIGN_OR_RETURN(records,
                     reader.ReadLevelRecords(zoom_layer.levels[i].record),
                     absl::StrFormat("Zoom level %d", i));
    for (const HierRecord& record : records) {
      std::string file;
      ASSIGN_OR_RETURN(file, DataFileName(descriptor, record.file_number));
      RETURN_IF_ERROR(
          files.Validate(DataLocation{record.file_number, record.offset,
                                      record.length}),
          absl::StrFormat("Tile %d of zoom level %d", record.tile_index, i));
      GridPosition grid;
      ASSIGN_OR_RETURN(grid,
                       TileGridPosition(record.tile_index, descriptor.tiles_x));
      level.Field(absl::StrFormat("Tile %5d x %5d", grid.x, grid.y),
                  absl::StrFormat("%s %10d + %10d", file, record.offset,
                                  record.length));
    }
  }

  return absl::OkStatus();
}

absl::StatusOr<int> ExtractLevelTiles(const MrxsIndexReader& reader,
                                      const DataFileSet& files, int record,
                                      const fs::path& output_dir) {
  std::vector<HierRecord> records;
  ASSIGN_OR_RETURN(records, reader.ReadLevelRecords(record));

  int written = 0;
  for (const HierRecord& entry : records) {
    const DataLocation location{entry.file_number, entry.offset, entry.length};
    std::vector<uint8_t> data;
    ASSIGN_OR_RETURN(data, files.ReadBlob(location),
                     absl::StrFormat("Tile %d", entry.tile_index));

    const fs::path out = output_dir / absl::StrFormat(
                                          "Data%04d_%010d.jpg",
                                          entry.file_number, entry.tile_index);
    RETURN_IF_ERROR(WriteFile(out, data), "Failed to extract tile");
    ++written;
  }

  LOG(INFO) << "Extracted " << written << " tiles of record " << record
            << " to " << output_dir.string();
  return written;
}

absl::StatusOr<int> ExtractNonHierRecords(const MrxsIndexReader& reader,
                                          const DataFileSet& files,
                                          int record_count,
                                          const fs::path& output_dir) {
  int written = 0;
  for (int record = 0; record < record_count; ++record) {
    std::optional<DataLocation> location;
    ASSIGN_OR_RETURN(location, reader.ReadNonHierRecord(record));
    if (!location.has_value()) {
      continue;
    }

    std::vector<uint8_t> data;
    ASSIGN_OR_RETURN(data, files.ReadBlob(*location),
                     absl::StrFormat("Non-hierarchical record %d", record));
    RETURN_IF_ERROR(
        WriteFile(output_dir / absl::StrFormat("nonhier_%04d.dat", record),
                  data),
        "Failed to extract record");
    ++written;
  }

  LOG(INFO) << "Extracted " << written << " of " << record_count
            << " non-hierarchical records to " << output_dir.string();
  return written;
}

int NonHierRecordCount(const SlideDescriptor& descriptor) {
  int count = 0;
  for (const slidedat::DescriptorLayer& layer : descriptor.nonhier_layers) {
    count += static_cast<int>(layer.levels.size());
  }
  return count;
}

}  // namespace miraxindex
