#pragma once

#include <tabledep/models.h>

#include <string>
#include <vector>

namespace tabledep {

// Keeps one record per identity key, in order of first appearance. A later
// duplicate replaces the kept record only when its confidence is strictly
// higher.
std::vector<Evidence> Deduplicate(const std::vector<Evidence> &evidence);

// Removes has_many/has_one records; they point away from the target.
std::vector<Evidence>
DropReverseAssociations(const std::vector<Evidence> &evidence);

// With a non-empty known-table set only known tables survive. The target
// table is always removed.
std::vector<Evidence> FilterKnownTables(const std::vector<Evidence> &evidence,
                                        const SchemaIndex &index,
                                        const std::string &target_table);

// Checks named columns against the schema column map. Records whose table
// is not in the map pass untouched; an empty map disables validation.
std::vector<Evidence> ValidateAgainstSchema(const std::vector<Evidence> &evidence,
                                            const SchemaIndex &index,
                                            ValidationMode mode);

std::vector<Evidence> FilterByConfidence(const std::vector<Evidence> &evidence,
                                         Confidence minimum);

// Stable order: confidence descending, then file path, then line number.
void Rank(std::vector<Evidence> &evidence);

// Strips `root` and the separators after it from each file path under
// `root`. Other paths are left as they are.
void RelativizePaths(std::vector<Evidence> &evidence, const std::string &root);

} // namespace tabledep
