#include <tabledep/tabular_reporter.h>

#include <tabledep/escaping.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tabledep {
namespace {

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "csv";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

// Inline code span whose fence is longer than any backtick run inside `text`.
std::string CodeSpan(const std::string &text) {
  std::size_t longest = 0;
  std::size_t current = 0;
  for (const auto character : text) {
    current = character == '`' ? current + 1 : 0;
    longest = std::max(longest, current);
  }
  if (longest == 0) {
    return "`" + text + "`";
  }
  const std::string fence(longest + 1, '`');
  return fence + " " + text + " " + fence;
}

std::string VerifiedName(bool verified) { return verified ? "True" : "False"; }

std::string BuildCsv(const ScanOutcome &outcome) {
  std::ostringstream csv;
  csv << Join(CsvColumns(), ",", [](const std::string &column) {
    return column;
  }) << "\r\n";
  for (const auto &item : outcome.evidence) {
    const std::vector<std::string> fields{item.file_path,
                                          std::to_string(item.line_number),
                                          item.table_name,
                                          item.column_name,
                                          ReferenceKindName(item.kind),
                                          item.snippet,
                                          ConfidenceName(item.confidence),
                                          VerifiedName(item.schema_verified)};
    csv << Join(fields, ",", EscapeCsvField) << "\r\n";
  }
  return csv.str();
}

std::string BuildSummaryMarkdown(const ScanOutcome &outcome,
                                 const ReportConfig &config,
                                 const std::string &timestamp) {
  const auto &statistics = outcome.statistics;
  std::ostringstream section;
  section << "## Scan Summary\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Source | " << EscapeMarkdownCell(config.root_path) << " |\n";
  section << "| Table | " << EscapeMarkdownCell(config.table_name) << " |\n";
  section << "| Minimum Confidence | " << ConfidenceName(config.min_confidence)
          << " |\n";
  section << "| Files Scanned | " << statistics.total_files_scanned << " |\n";
  section << "| Raw Hits | " << statistics.raw_hits << " |\n";
  section << "| After Deduplication | " << statistics.after_dedup << " |\n";
  section << "| After Schema Validation | " << statistics.after_validation
          << " |\n";
  section << "| Reported | " << statistics.after_filter << " |\n\n";

  section << "### Scanner Hits\n\n";
  if (statistics.scanner_hits.empty()) {
    section << "- None\n\n";
    return section.str();
  }
  for (const auto &[name, count] : statistics.scanner_hits) {
    section << "- " << name << ": " << count << "\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildEvidenceMarkdown(const ScanOutcome &outcome) {
  std::ostringstream section;
  section << "## Dependencies\n\n";
  section << "| File | Line | Table | Column | Reference | Confidence | "
             "Verified | Snippet |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- | --- |\n";
  if (outcome.evidence.empty()) {
    section << "| None | - | - | - | - | - | - | - |\n";
    return section.str();
  }

  for (const auto &item : outcome.evidence) {
    std::string column = "-";
    if (!item.column_name.empty()) {
      column = EscapeMarkdownCell(item.column_name);
      if (item.column_datatype) {
        column += " (" + *item.column_datatype + ")";
      }
    }
    section << "| " << EscapeMarkdownCell(item.file_path) << " | "
            << item.line_number << " | " << EscapeMarkdownCell(item.table_name)
            << " | " << column << " | " << ReferenceKindName(item.kind)
            << " | " << ConfidenceName(item.confidence) << " | "
            << (item.schema_verified ? "yes" : "no") << " | "
            << CodeSpan(EscapeMarkdownCell(item.snippet)) << " |\n";
  }
  return section.str();
}

std::string BuildStatisticsJson(const ScanStatistics &statistics) {
  std::ostringstream json;
  json << "\"statistics\": {";
  json << "\"total_files_scanned\": " << statistics.total_files_scanned << ",";
  json << "\"raw_hits\": " << statistics.raw_hits << ",";
  json << "\"after_dedup\": " << statistics.after_dedup << ",";
  json << "\"after_validation\": " << statistics.after_validation << ",";
  json << "\"after_filter\": " << statistics.after_filter << ",";
  json << "\"scanner_hits\": {"
       << Join(statistics.scanner_hits, ",",
               [](const auto &entry) {
                 return "\"" + EscapeJsonString(entry.first) +
                        "\": " + std::to_string(entry.second);
               })
       << "}}";
  return json.str();
}

std::string BuildEvidenceJson(const ScanOutcome &outcome) {
  std::ostringstream json;
  json << "\"evidence\": [";
  json << Join(outcome.evidence, ",", [](const Evidence &item) {
    std::ostringstream entry;
    entry << "{\"file_path\": \"" << EscapeJsonString(item.file_path) << "\",";
    entry << "\"line_number\": " << item.line_number << ",";
    entry << "\"table_name\": \"" << EscapeJsonString(item.table_name)
          << "\",";
    entry << "\"column_name\": \"" << EscapeJsonString(item.column_name)
          << "\",";
    if (item.column_datatype) {
      entry << "\"column_datatype\": \""
            << EscapeJsonString(*item.column_datatype) << "\",";
    }
    entry << "\"reference_type\": \"" << ReferenceKindName(item.kind) << "\",";
    entry << "\"code_snippet\": \"" << EscapeJsonString(item.snippet) << "\",";
    entry << "\"confidence\": \"" << ConfidenceName(item.confidence) << "\",";
    entry << "\"schema_verified\": "
          << (item.schema_verified ? "true" : "false") << "}";
    return entry.str();
  });
  json << "]";
  return json.str();
}

} // namespace

const std::vector<std::string> &CsvColumns() {
  static const std::vector<std::string> kColumns = {
      "file_path",      "line_number",  "table_name", "column_name",
      "reference_type", "code_snippet", "confidence", "schema_verified"};
  return kColumns;
}

Report TabularReporter::Render(const ScanOutcome &outcome,
                               const ReportConfig &config) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::ostringstream timestamp_stream;
  timestamp_stream << std::put_time(std::gmtime(&now_time), "%FT%TZ");
  const auto timestamp = timestamp_stream.str();

  Report report;
  if (ShouldRenderFormat(config.formats, "csv")) {
    report.csv = BuildCsv(outcome);
  }

  if (ShouldRenderFormat(config.formats, "markdown")) {
    std::ostringstream output;
    output << "# Table Dependency Report\n\n";
    output << BuildSummaryMarkdown(outcome, config, timestamp);
    output << BuildEvidenceMarkdown(outcome);
    report.markdown = output.str();
  }

  if (ShouldRenderFormat(config.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << "\"generated_on\": \"" << timestamp << "\",";
    output << "\"source\": \"" << EscapeJsonString(config.root_path) << "\",";
    output << "\"table\": \"" << EscapeJsonString(config.table_name) << "\",";
    output << "\"min_confidence\": \"" << ConfidenceName(config.min_confidence)
           << "\",";
    output << BuildStatisticsJson(outcome.statistics) << ",";
    output << BuildEvidenceJson(outcome);
    output << "}";
    report.json = output.str();
  }

  return report;
}

} // namespace tabledep
