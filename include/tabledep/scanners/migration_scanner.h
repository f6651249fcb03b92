#pragma once

#include <tabledep/scanners/scanner_support.h>

#include <regex>

namespace tabledep {

// Column, reference and foreign key changes in migration files.
class MigrationScanner : public TargetedScanner {
public:
  explicit MigrationScanner(ScanTarget target);

  std::string Name() const override { return "MigrationScanner"; }
  std::vector<FileCategory> Categories() const override {
    return {FileCategory::kMigration};
  }
  std::vector<Evidence> ScanFile(const std::string &path,
                                 const std::vector<std::string> &lines,
                                 FileCategory category) const override;

private:
  std::regex create_table_;
  std::regex add_reference_;
  std::regex add_column_;
  std::regex add_foreign_key_;
  std::regex inline_reference_;
  std::regex remove_reference_;
  std::regex remove_column_;
};

} // namespace tabledep
