#pragma once

#include <tabledep/scanners/scanner_support.h>

#include <string>
#include <vector>

namespace tabledep {

// A `{prefix}_type` / `{prefix}_id` column pair declared on one table.
struct PolymorphicPair {
  std::string schema_path;
  std::string table;
  std::string prefix;
  int id_line = 0;
  std::string id_line_text;
};

// Pass 1 of the resolver: every pair whose two halves appear in the same
// table block of a schema file. Blocks of the target table are ignored.
std::vector<PolymorphicPair>
CollectPolymorphicPairs(const ScanTarget &target, const CategorizedFiles &files,
                        const LoadedSources &sources);

// Resolves polymorphic pairs that may point at the target. A pair is
// confirmed by a model declaring `has_many :table, as: :prefix` (HIGH) or
// corroborated by any code line naming `prefix_type` together with the
// target class (MEDIUM). Pairs with neither are dropped.
std::vector<Evidence> ResolvePolymorphicPairs(const ScanTarget &target,
                                              const CategorizedFiles &files,
                                              const LoadedSources &sources);

class PolymorphicResolver : public TargetedScanner {
public:
  explicit PolymorphicResolver(ScanTarget target)
      : TargetedScanner(std::move(target)) {}

  std::string Name() const override { return "PolymorphicResolver"; }
  std::vector<FileCategory> Categories() const override {
    return {FileCategory::kSchema, FileCategory::kModel};
  }
  // Resolution needs the whole tree; per-file scanning yields nothing.
  std::vector<Evidence> ScanFile(const std::string &path,
                                 const std::vector<std::string> &lines,
                                 FileCategory category) const override;
  std::vector<Evidence> ScanAll(const CategorizedFiles &files,
                                const LoadedSources &sources) const override;
};

} // namespace tabledep
