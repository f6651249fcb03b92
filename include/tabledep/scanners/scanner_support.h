#pragma once

#include <tabledep/interfaces.h>
#include <tabledep/models.h>

#include <cstddef>
#include <regex>
#include <string>
#include <utility>

namespace tabledep {

constexpr std::size_t kMaxSnippetLength = 200;

// Escapes ECMAScript regex metacharacters so that a table or column name
// can be embedded in a pattern literally.
std::string EscapeRegex(const std::string &value);

std::string Trim(const std::string &value);

// Trimmed text capped at kMaxSnippetLength characters.
std::string MakeSnippet(const std::string &text);

Evidence MakeEvidence(const std::string &path, int line_number,
                      std::string table, std::string column,
                      ReferenceKind kind, const std::string &line,
                      Confidence confidence);

// Returns capture group `group` of the first match, or an empty string.
std::string SearchGroup(const std::string &text, const std::regex &pattern,
                        std::size_t group);

bool Contains(const std::string &text, const std::regex &pattern);

std::string ToLowerAscii(const std::string &value);

// Position of the first occurrence of `needle` at or after `from` that is not
// preceded by a word character, or npos.
std::size_t FindWordStart(const std::string &text, const std::string &needle,
                          std::size_t from = 0);

// Base for scanners that look for references to one target table.
class TargetedScanner : public Scanner {
public:
  explicit TargetedScanner(ScanTarget target) : target_(std::move(target)) {}

  const ScanTarget &target() const { return target_; }

protected:
  ScanTarget target_;
};

} // namespace tabledep
