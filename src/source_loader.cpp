#include <tabledep/source_loader.h>

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace tabledep {

std::vector<std::string> SplitLines(const std::string &content) {
  std::vector<std::string> lines;
  std::string current;
  for (const auto character : content) {
    if (character == '\n') {
      if (!current.empty() && current.back() == '\r') {
        current.pop_back();
      }
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (!current.empty()) {
    if (current.back() == '\r') {
      current.pop_back();
    }
    lines.push_back(std::move(current));
  }
  return lines;
}

std::optional<std::vector<std::string>>
ReadSourceLines(const std::filesystem::path &path, Logger &logger) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    logger.Log(LogLevel::kWarn, "source.unreadable",
               {{"path", path.string()}, {"error", "cannot open file"}});
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << stream.rdbuf();
  if (stream.bad()) {
    logger.Log(LogLevel::kWarn, "source.unreadable",
               {{"path", path.string()}, {"error", "read failed"}});
    return std::nullopt;
  }
  auto lines = SplitLines(buffer.str());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (lines[i].size() <= kMaxLineLength) {
      continue;
    }
    logger.Log(LogLevel::kWarn, "source.long_line",
               {{"path", path.string()},
                {"line", std::to_string(i + 1)},
                {"length", std::to_string(lines[i].size())}});
    lines[i].resize(kMaxLineLength);
  }
  return lines;
}

FileSourceLoader::FileSourceLoader(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

LoadedSources FileSourceLoader::Load(const CategorizedFiles &files) {
  LoadedSources sources;
  std::size_t unreadable = 0;
  for (const auto &[category, paths] : files) {
    for (const auto &path : paths) {
      auto lines = ReadSourceLines(path, *logger_);
      if (!lines) {
        ++unreadable;
        continue;
      }
      sources.lines_by_path.emplace(path, std::move(*lines));
    }
  }
  logger_->Log(LogLevel::kDebug, "Loaded source files",
               {{"loaded", std::to_string(sources.lines_by_path.size())},
                {"unreadable", std::to_string(unreadable)}});
  return sources;
}

} // namespace tabledep
