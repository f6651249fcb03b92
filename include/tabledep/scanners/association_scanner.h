#pragma once

#include <tabledep/scanners/scanner_support.h>

#include <regex>
#include <set>
#include <string>

namespace tabledep {

// Maps a model class to its table. The naive inflected name wins when it is
// a known table or no tables are known; otherwise leading namespace-like
// segments are dropped until a known table matches.
std::string ResolveClassTable(const std::string &class_name,
                              const std::set<std::string> &known_tables);

// Ownership associations declared in model classes. A belongs_to puts the
// foreign key on the declaring class's table; has_many/has_one on the
// target table describe the reverse direction and are tagged as such.
class AssociationScanner : public TargetedScanner {
public:
  AssociationScanner(ScanTarget target, std::set<std::string> known_tables);

  std::string Name() const override { return "AssociationScanner"; }
  std::vector<FileCategory> Categories() const override {
    return {FileCategory::kModel};
  }
  std::vector<Evidence> ScanFile(const std::string &path,
                                 const std::vector<std::string> &lines,
                                 FileCategory category) const override;

private:
  std::string ForeignKeyOption(const std::string &line,
                               const std::string &fallback) const;

  std::set<std::string> known_tables_;
  std::regex class_;
  std::regex belongs_to_;
  std::regex has_many_;
  std::regex has_one_;
  std::regex indirect_;
  std::regex foreign_key_;
  std::regex through_;
};

} // namespace tabledep
