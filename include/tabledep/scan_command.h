#pragma once

#include <tabledep/logging.h>
#include <tabledep/models.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace tabledep {

struct ScanOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::string> table;
  std::optional<std::string> foreign_key;
  std::optional<std::string> primary_key;
  std::optional<Confidence> min_confidence;
  std::optional<bool> strict;
  std::vector<std::string> formats;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> scanners;
  std::optional<std::string> reporter;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

ScanOptions ParseScanArguments(const std::vector<std::string> &arguments);
ScanOptions ParseConfigFile(const std::filesystem::path &path);
// Command-line values win over config file values.
ScanOptions MergeOptions(const ScanOptions &config_options,
                         const ScanOptions &cli_options);
// Loads the config file named on the command line, merges, and checks that
// the required options are present.
ScanOptions ResolveScanOptions(const ScanOptions &cli_options);

ScanRequest BuildScanRequest(const ScanOptions &options);
ReportConfig BuildReportConfig(const ScanOptions &options);

// Human-readable run summary: file count, per-scanner hits, result count.
void PrintScanSummary(const ScanOutcome &outcome, Confidence min_confidence,
                      std::ostream &stream);

int RunScan(const std::vector<std::string> &arguments);
int RunListScanners(const std::vector<std::string> &arguments);

} // namespace tabledep
