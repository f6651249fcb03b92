#include <tabledep/evidence_reconciler.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <map>
#include <tuple>
#include <utility>

namespace tabledep {

std::vector<Evidence> Deduplicate(const std::vector<Evidence> &evidence) {
  std::vector<Evidence> unique;
  std::map<Evidence::Key, std::size_t> position_by_key;
  for (const auto &item : evidence) {
    const auto [it, inserted] =
        position_by_key.emplace(item.IdentityKey(), unique.size());
    if (inserted) {
      unique.push_back(item);
      continue;
    }
    auto &kept = unique[it->second];
    if (ConfidenceRank(item.confidence) > ConfidenceRank(kept.confidence)) {
      kept = item;
    }
  }
  return unique;
}

std::vector<Evidence>
DropReverseAssociations(const std::vector<Evidence> &evidence) {
  std::vector<Evidence> kept;
  std::copy_if(evidence.begin(), evidence.end(), std::back_inserter(kept),
               [](const Evidence &item) {
                 return !IsReverseAssociation(item.kind);
               });
  return kept;
}

std::vector<Evidence> FilterKnownTables(const std::vector<Evidence> &evidence,
                                        const SchemaIndex &index,
                                        const std::string &target_table) {
  std::vector<Evidence> kept;
  for (const auto &item : evidence) {
    if (!index.known_tables.empty() &&
        index.known_tables.count(item.table_name) == 0) {
      continue;
    }
    if (item.table_name == target_table) {
      continue;
    }
    kept.push_back(item);
  }
  return kept;
}

std::vector<Evidence> ValidateAgainstSchema(const std::vector<Evidence> &evidence,
                                            const SchemaIndex &index,
                                            ValidationMode mode) {
  if (index.columns.empty()) {
    return evidence;
  }

  std::vector<Evidence> validated;
  for (auto item : evidence) {
    const auto table = index.columns.find(item.table_name);
    if (item.column_name.empty() || table == index.columns.end()) {
      validated.push_back(std::move(item));
      continue;
    }

    const auto column = table->second.find(item.column_name);
    if (column != table->second.end()) {
      item.column_datatype = column->second;
      validated.push_back(std::move(item));
      continue;
    }

    switch (mode) {
    case ValidationMode::kStrict:
      break;
    case ValidationMode::kLenient:
      item.confidence = Confidence::kLow;
      item.schema_verified = false;
      validated.push_back(std::move(item));
      break;
    }
  }
  return validated;
}

std::vector<Evidence> FilterByConfidence(const std::vector<Evidence> &evidence,
                                         Confidence minimum) {
  std::vector<Evidence> kept;
  std::copy_if(evidence.begin(), evidence.end(), std::back_inserter(kept),
               [minimum](const Evidence &item) {
                 return ConfidenceRank(item.confidence) >=
                        ConfidenceRank(minimum);
               });
  return kept;
}

void Rank(std::vector<Evidence> &evidence) {
  std::stable_sort(evidence.begin(), evidence.end(),
                   [](const Evidence &lhs, const Evidence &rhs) {
                     return std::make_tuple(-ConfidenceRank(lhs.confidence),
                                            std::cref(lhs.file_path),
                                            lhs.line_number) <
                            std::make_tuple(-ConfidenceRank(rhs.confidence),
                                            std::cref(rhs.file_path),
                                            rhs.line_number);
                   });
}

void RelativizePaths(std::vector<Evidence> &evidence, const std::string &root) {
  for (auto &item : evidence) {
    auto &path = item.file_path;
    if (root.empty() || path.compare(0, root.size(), root) != 0) {
      continue;
    }
    path.erase(0, root.size());
    const auto first = path.find_first_not_of('/');
    path.erase(0, first == std::string::npos ? path.size() : first);
  }
}

} // namespace tabledep
