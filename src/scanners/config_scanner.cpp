#include <tabledep/scanners/config_scanner.h>

#include <filesystem>
#include <utility>

namespace tabledep {

namespace {

constexpr char kConnectionSettingsFile[] = "database.yml";

} // namespace

ConfigScanner::ConfigScanner(ScanTarget target)
    : TargetedScanner(std::move(target)) {
  const auto table = EscapeRegex(target_.table);
  table_ = std::regex(R"re(\b)re" + table + R"re(\b)re");
  key_value_ = std::regex(R"re(:\s*)re" + table + R"re(\b)re");
  foreign_key_prefix_ =
      std::regex(R"re(\b)re" + EscapeRegex(target_.singular) + "_");
  comment_ = std::regex(R"re(^\s*#)re");
}

std::vector<Evidence>
ConfigScanner::ScanFile(const std::string &path,
                        const std::vector<std::string> &lines,
                        FileCategory) const {
  if (std::filesystem::path(path).filename() == kConnectionSettingsFile) {
    return {};
  }

  std::vector<Evidence> evidence;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto &line = lines[i];
    if (Contains(line, comment_) || !Contains(line, table_)) {
      continue;
    }
    const auto confidence =
        Contains(line, key_value_) || Contains(line, foreign_key_prefix_)
            ? Confidence::kMedium
            : Confidence::kLow;
    evidence.push_back(MakeEvidence(path, static_cast<int>(i + 1),
                                    target_.table, "",
                                    ReferenceKind::kConfigTableReference,
                                    line, confidence));
  }
  return evidence;
}

} // namespace tabledep
