#pragma once

#include <tabledep/models.h>

#include <filesystem>
#include <string>
#include <vector>

namespace tabledep {

class FileClassifier {
public:
  virtual ~FileClassifier() = default;
  virtual CategorizedFiles Classify(const std::filesystem::path &root) = 0;
};

class SourceLoader {
public:
  virtual ~SourceLoader() = default;
  virtual LoadedSources Load(const CategorizedFiles &files) = 0;
};

class SchemaIndexer {
public:
  virtual ~SchemaIndexer() = default;
  virtual SchemaIndex BuildIndex(const CategorizedFiles &files,
                                 const LoadedSources &sources) = 0;
};

// A scanner reads the files of the categories it declares and emits
// evidence for one family of reference patterns. ScanFile must not keep
// state between calls.
class Scanner {
public:
  virtual ~Scanner() = default;
  virtual std::string Name() const = 0;
  virtual std::vector<FileCategory> Categories() const = 0;
  virtual std::vector<Evidence> ScanFile(const std::string &path,
                                         const std::vector<std::string> &lines,
                                         FileCategory category) const = 0;
  virtual std::vector<Evidence> ScanAll(const CategorizedFiles &files,
                                        const LoadedSources &sources) const;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const ScanOutcome &outcome,
                        const ReportConfig &config) = 0;
};

class ScanPipeline {
public:
  virtual ~ScanPipeline() = default;
  virtual ScanOutcome Run(const ScanRequest &request) = 0;
};

} // namespace tabledep
