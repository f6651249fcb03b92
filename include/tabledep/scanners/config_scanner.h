#pragma once

#include <tabledep/scanners/scanner_support.h>

#include <regex>

namespace tabledep {

// Table name mentions in YAML settings. database.yml names databases, not
// tables, and is skipped.
class ConfigScanner : public TargetedScanner {
public:
  explicit ConfigScanner(ScanTarget target);

  std::string Name() const override { return "ConfigScanner"; }
  std::vector<FileCategory> Categories() const override {
    return {FileCategory::kConfig};
  }
  std::vector<Evidence> ScanFile(const std::string &path,
                                 const std::vector<std::string> &lines,
                                 FileCategory category) const override;

private:
  std::regex table_;
  std::regex key_value_;
  std::regex foreign_key_prefix_;
  std::regex comment_;
};

} // namespace tabledep
