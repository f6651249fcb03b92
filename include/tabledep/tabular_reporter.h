#pragma once

#include <tabledep/interfaces.h>

#include <string>
#include <vector>

namespace tabledep {

// Column order of every CSV report.
const std::vector<std::string> &CsvColumns();

// Renders CSV, Markdown and JSON views of a scan outcome. Only the formats
// named in the config are filled; an empty list means CSV.
class TabularReporter : public Reporter {
public:
  Report Render(const ScanOutcome &outcome,
                const ReportConfig &config) override;
};

} // namespace tabledep
