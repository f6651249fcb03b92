#pragma once

#include <tabledep/interfaces.h>
#include <tabledep/logging.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabledep {

// Lines longer than this are truncated when loaded.
constexpr std::size_t kMaxLineLength = 4096;

// Splits on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> SplitLines(const std::string &content);

std::optional<std::vector<std::string>>
ReadSourceLines(const std::filesystem::path &path, Logger &logger);

class FileSourceLoader : public SourceLoader {
public:
  explicit FileSourceLoader(std::shared_ptr<Logger> logger = nullptr);
  LoadedSources Load(const CategorizedFiles &files) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace tabledep
