#pragma once

#include <tabledep/scanners/scanner_support.h>

#include <regex>

namespace tabledep {

// Hand-written SQL and query-builder calls. Heredoc blocks whose delimiter
// contains "SQL" are scanned as one statement reported at the opening line.
class RawQueryScanner : public TargetedScanner {
public:
  explicit RawQueryScanner(ScanTarget target);

  std::string Name() const override { return "RawQueryScanner"; }
  std::vector<FileCategory> Categories() const override {
    return {FileCategory::kOtherSource, FileCategory::kModel,
            FileCategory::kTemplate, FileCategory::kRawSql,
            FileCategory::kMigration};
  }
  std::vector<Evidence> ScanFile(const std::string &path,
                                 const std::vector<std::string> &lines,
                                 FileCategory category) const override;

  std::vector<Evidence> ScanLine(const std::string &path, int line_number,
                                 const std::string &line) const;
  std::vector<Evidence> ScanBlock(const std::string &path, int start_line,
                                  const std::string &block) const;

private:
  bool MentionsInQueryMethod(const std::string &line) const;
  bool MentionsInInterpolation(const std::string &line) const;

  std::string lowered_singular_;
  std::regex column_reference_;
  std::regex table_statement_;
  std::regex join_;
  std::regex query_method_;
};

} // namespace tabledep
