#pragma once

#include <tabledep/scanners/scanner_support.h>

#include <regex>

namespace tabledep {

// Structural foreign key declarations inside `create_table` blocks of the
// schema definition.
class SchemaScanner : public TargetedScanner {
public:
  explicit SchemaScanner(ScanTarget target);

  std::string Name() const override { return "SchemaScanner"; }
  std::vector<FileCategory> Categories() const override {
    return {FileCategory::kSchema};
  }
  std::vector<Evidence> ScanFile(const std::string &path,
                                 const std::vector<std::string> &lines,
                                 FileCategory category) const override;

private:
  std::regex create_table_;
  std::regex column_;
  std::regex reference_;
};

} // namespace tabledep
