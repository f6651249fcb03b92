#pragma once

#include <tabledep/interfaces.h>
#include <tabledep/logging.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace tabledep {

// Category for a path relative to the scan root, or nullopt when the file
// is not scanned at all.
std::optional<FileCategory>
CategorizePath(const std::filesystem::path &relative_path);

bool IsSkippedDirectoryName(const std::string &name);

class FilesystemFileClassifier : public FileClassifier {
public:
  explicit FilesystemFileClassifier(std::shared_ptr<Logger> logger = nullptr);
  CategorizedFiles Classify(const std::filesystem::path &root) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace tabledep
