#include <tabledep/file_classifier.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace tabledep {

namespace {

std::filesystem::path ResolveRoot(const std::filesystem::path &root) {
  if (root.empty()) {
    throw std::invalid_argument("Scan root path must not be empty.");
  }
  const auto normalized = std::filesystem::weakly_canonical(root);
  std::error_code error;
  if (!std::filesystem::is_directory(normalized, error)) {
    throw std::runtime_error("Scan root path is not a directory: " +
                             normalized.string());
  }
  return normalized;
}

bool HasSkippedComponent(const std::filesystem::path &relative) {
  return std::any_of(relative.begin(), relative.end(), [](const auto &part) {
    return IsSkippedDirectoryName(part.string());
  });
}

std::vector<std::string> Components(const std::filesystem::path &relative) {
  std::vector<std::string> parts;
  for (const auto &part : relative) {
    parts.push_back(part.string());
  }
  return parts;
}

} // namespace

bool IsSkippedDirectoryName(const std::string &name) {
  static const std::set<std::string> kSkipped = {"vendor", "node_modules",
                                                 ".git", "tmp", "log"};
  return kSkipped.count(name) > 0;
}

std::optional<FileCategory>
CategorizePath(const std::filesystem::path &relative_path) {
  const auto parts = Components(relative_path);
  const auto extension = relative_path.extension().string();

  if (parts.size() == 2 && parts[0] == "db" && parts[1] == "schema.rb") {
    return FileCategory::kSchema;
  }
  if (parts.size() >= 2 && parts[0] == "db" && parts[1] == "migrate" &&
      extension == ".rb") {
    return FileCategory::kMigration;
  }
  if (parts.size() >= 2 && parts[0] == "app" && parts[1] == "models" &&
      extension == ".rb") {
    return FileCategory::kModel;
  }
  if (extension == ".rb") {
    return FileCategory::kOtherSource;
  }
  if (extension == ".sql") {
    return FileCategory::kRawSql;
  }
  if (extension == ".erb") {
    return FileCategory::kTemplate;
  }
  if (extension == ".yml" || extension == ".yaml") {
    return FileCategory::kConfig;
  }
  return std::nullopt;
}

FilesystemFileClassifier::FilesystemFileClassifier(
    std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

CategorizedFiles
FilesystemFileClassifier::Classify(const std::filesystem::path &root) {
  const auto resolved_root = ResolveRoot(root);
  CategorizedFiles categorized;

  std::error_code error;
  std::filesystem::recursive_directory_iterator it(
      resolved_root,
      std::filesystem::directory_options::skip_permission_denied, error);
  if (error) {
    throw std::runtime_error("Cannot walk scan root " +
                             resolved_root.string() + ": " + error.message());
  }

  const std::filesystem::recursive_directory_iterator end;
  while (it != end) {
    const auto entry = *it;
    const auto relative = entry.path().lexically_relative(resolved_root);

    std::error_code status_error;
    if (entry.is_directory(status_error)) {
      if (IsSkippedDirectoryName(entry.path().filename().string())) {
        it.disable_recursion_pending();
      }
    } else if (entry.is_regular_file(status_error) &&
               !HasSkippedComponent(relative)) {
      if (const auto category = CategorizePath(relative)) {
        categorized[*category].push_back(entry.path().string());
      }
    }
    if (status_error) {
      logger_->Log(LogLevel::kWarn, "classifier.skip",
                   {{"path", entry.path().string()},
                    {"error", status_error.message()}});
    }

    it.increment(error);
    if (error) {
      logger_->Log(LogLevel::kWarn, "classifier.skip",
                   {{"path", entry.path().string()},
                    {"error", error.message()}});
      error.clear();
    }
  }

  std::size_t total = 0;
  for (auto &[category, paths] : categorized) {
    std::sort(paths.begin(), paths.end());
    total += paths.size();
    logger_->Log(LogLevel::kDebug, "classifier.category",
                 {{"category", FileCategoryName(category)},
                  {"count", std::to_string(paths.size())}});
  }

  logger_->Log(LogLevel::kInfo, "Classified source files",
               {{"count", std::to_string(total)},
                {"root", resolved_root.string()}});
  return categorized;
}

} // namespace tabledep
