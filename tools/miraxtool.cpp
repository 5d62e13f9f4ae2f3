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

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "miraxindex/data_files.h"
#include "miraxindex/index/index_constants.h"
#include "miraxindex/index/index_reader.h"
#include "miraxindex/index/pointer_walker.h"
#include "miraxindex/index/position_map.h"
#include "miraxindex/report.h"
#include "miraxindex/slide_dump.h"
#include "miraxindex/slidedat/slide_descriptor.h"

// Common flags
ABSL_FLAG(std::string, input, "",
          "Path to the .mrxs slide (dump, extract), the Index.dat (words, "
          "walk) or the stitching layer file (stitching)");
ABSL_FLAG(bool, verbose, false, "Route the dump report to the log");

// Validator flags
ABSL_FLAG(int64_t, header_offset, miraxindex::constants::kDefaultHeaderOffset,
          "Byte offset of the first word after the index header");
ABSL_FLAG(int64_t, start, 0, "Word index the graph walk starts from");

// Extract flags
ABSL_FLAG(int, level, -1, "Zoom level to extract (-1 for all levels)");
ABSL_FLAG(std::string, output_dir, "extracted",
          "Directory the extracted blobs are written to");

namespace fs = std::filesystem;

namespace {

int DumpCommand(const std::string& input_file, bool verbose) {
  miraxindex::TextReportSink text_sink(std::cout);
  miraxindex::LogReportSink log_sink;
  miraxindex::ReportSink& sink =
      verbose ? static_cast<miraxindex::ReportSink&>(log_sink) : text_sink;

  auto status = miraxindex::DumpSlide(input_file, miraxindex::Reporter(sink));
  if (!status.ok()) {
    std::cerr << "\nError: Failed to dump slide\n";
    std::cerr << "Status: " << status << '\n';
    return 1;
  }
  return 0;
}

int WordsCommand(const std::string& input_file, int64_t header_offset) {
  auto snapshot_or =
      miraxindex::WordStreamSnapshot::Load(input_file, header_offset);
  if (!snapshot_or.ok()) {
    std::cerr << "Error: Failed to load word stream\n";
    std::cerr << "Status: " << snapshot_or.status() << '\n';
    return 1;
  }

  miraxindex::TextWalkSink sink(std::cout);
  miraxindex::DumpWords(*snapshot_or, sink);
  return 0;
}

int WalkCommand(const std::string& input_file, int64_t header_offset,
                int64_t start) {
  auto snapshot_or =
      miraxindex::WordStreamSnapshot::Load(input_file, header_offset);
  if (!snapshot_or.ok()) {
    std::cerr << "Error: Failed to load word stream\n";
    std::cerr << "Status: " << snapshot_or.status() << '\n';
    return 1;
  }

  miraxindex::TextWalkSink sink(std::cout);
  miraxindex::WalkGraph(*snapshot_or, start, sink);
  return 0;
}

int ExtractCommand(const std::string& input_file, int level,
                   const fs::path& output_dir) {
  auto descriptor_or = miraxindex::SlideDescriptor::Load(input_file);
  if (!descriptor_or.ok()) {
    std::cerr << "Error: Failed to read slide descriptor\n";
    std::cerr << "Status: " << descriptor_or.status() << '\n';
    return 1;
  }
  const auto& descriptor = *descriptor_or;

  auto reader_or = miraxindex::MrxsIndexReader::Open(descriptor.IndexPath(),
                                                     descriptor.Layout());
  if (!reader_or.ok()) {
    std::cerr << "Error: Failed to open index\n";
    std::cerr << "Status: " << reader_or.status() << '\n';
    return 1;
  }
  miraxindex::DataFileSet files(descriptor.DataFilePaths());

  const auto& zoom_layer = descriptor.SlideZoomLayer();
  const int level_count = static_cast<int>(zoom_layer.levels.size());
  if (level >= level_count) {
    std::cerr << "Error: Level " << level << " out of range (0-"
              << level_count - 1 << ")\n";
    return 1;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    std::cerr << "Error: Cannot create " << output_dir << ": " << ec.message()
              << '\n';
    return 1;
  }

  int first = level < 0 ? 0 : level;
  int last = level < 0 ? level_count - 1 : level;
  for (int i = first; i <= last; ++i) {
    auto written_or =
        miraxindex::ExtractLevelTiles(*reader_or, files,
                                      zoom_layer.levels[i].record, output_dir);
    if (!written_or.ok()) {
      std::cerr << "Error: Failed to extract level " << i << '\n';
      std::cerr << "Status: " << written_or.status() << '\n';
      return 1;
    }
    std::cout << "Level " << i << ": " << *written_or << " tiles\n";
  }

  auto nonhier_or = miraxindex::ExtractNonHierRecords(
      *reader_or, files, miraxindex::NonHierRecordCount(descriptor),
      output_dir);
  if (!nonhier_or.ok()) {
    std::cerr << "Error: Failed to extract non-hierarchical records\n";
    std::cerr << "Status: " << nonhier_or.status() << '\n';
    return 1;
  }
  std::cout << "Non-hierarchical records: " << *nonhier_or << '\n';
  return 0;
}

int StitchingCommand(const std::string& input_file) {
  auto entries_or = miraxindex::ReadStitchingPositions(input_file);
  if (!entries_or.ok()) {
    std::cerr << "Error: Failed to read stitching positions\n";
    std::cerr << "Status: " << entries_or.status() << '\n';
    return 1;
  }

  for (const auto& entry : *entries_or) {
    std::cout << absl::StrFormat(
        "%10.6f %10.6f\n",
        entry.x / miraxindex::constants::kPositionFixedPointScale,
        entry.y / miraxindex::constants::kPositionFixedPointScale);
  }
  LOG(INFO) << "Read " << entries_or->size() << " stitching positions";
  return 0;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  dump       Print the slide descriptor and resolved index\n";
  std::cerr << "  words      Classify every word of an Index.dat\n";
  std::cerr << "  walk       Follow the pointer graph of an Index.dat\n";
  std::cerr << "  extract    Write referenced tiles and records to disk\n";
  std::cerr << "  stitching  Print the positions of a stitching layer\n";
  std::cerr << "\n";
  std::cerr << "Common options:\n";
  std::cerr << "  --input=<path>          Input file (required)\n";
  std::cerr << "\n";
  std::cerr << "Dump command options:\n";
  std::cerr << "  --verbose               Write the report to the log\n";
  std::cerr << "\n";
  std::cerr << "Words / walk command options:\n";
  std::cerr << "  --header_offset=<n>     Header size in bytes (default: 37)\n";
  std::cerr << "  --start=<n>             Walk start word (default: 0)\n";
  std::cerr << "\n";
  std::cerr << "Extract command options:\n";
  std::cerr << "  --level=<n>             Zoom level (default: all)\n";
  std::cerr
      << "  --output_dir=<path>     Output directory (default: extracted)\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name << " dump --input=slide.mrxs\n";
  std::cerr << "  " << program_name
            << " walk --input=slide/Index.dat --start=2\n";
  std::cerr << "  " << program_name
            << " extract --input=slide.mrxs --level=0 --output_dir=tiles\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string command = argv[1];

  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string input_file = absl::GetFlag(FLAGS_input);
  if (input_file.empty()) {
    std::cerr << "Error: --input flag is required\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (command == "dump") {
    return DumpCommand(input_file, absl::GetFlag(FLAGS_verbose));
  } else if (command == "words") {
    return WordsCommand(input_file, absl::GetFlag(FLAGS_header_offset));
  } else if (command == "walk") {
    return WalkCommand(input_file, absl::GetFlag(FLAGS_header_offset),
                       absl::GetFlag(FLAGS_start));
  } else if (command == "extract") {
    return ExtractCommand(input_file, absl::GetFlag(FLAGS_level),
                          absl::GetFlag(FLAGS_output_dir));
  } else if (command == "stitching") {
    return StitchingCommand(input_file);
  } else {
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
}
