#pragma once

#include <tabledep/scanners/scanner_support.h>

#include <regex>

namespace tabledep {

// Catch-all for identifiers resembling the target near query code, and
// comments mentioning it next to schema vocabulary. Always LOW.
class ContextualScanner : public TargetedScanner {
public:
  explicit ContextualScanner(ScanTarget target);

  std::string Name() const override { return "ContextualScanner"; }
  std::vector<FileCategory> Categories() const override {
    return {FileCategory::kOtherSource, FileCategory::kModel,
            FileCategory::kTemplate, FileCategory::kRawSql};
  }
  std::vector<Evidence> ScanFile(const std::string &path,
                                 const std::vector<std::string> &lines,
                                 FileCategory category) const override;

private:
  bool MentionsInComment(const std::string &line) const;

  std::string lowered_singular_;
  std::regex identifier_;
  std::regex query_keyword_;
  std::regex schema_keyword_;
};

} // namespace tabledep
