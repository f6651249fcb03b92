#pragma once

#include <tabledep/component_registry.h>
#include <tabledep/interfaces.h>
#include <tabledep/logging.h>
#include <tabledep/scan_coordinator.h>

#include <memory>
#include <string>
#include <vector>

namespace tabledep {

class DefaultScanPipeline;

struct PipelineComponents {
  std::unique_ptr<FileClassifier> classifier;
  std::unique_ptr<SourceLoader> loader;
  std::unique_ptr<SchemaIndexer> indexer;
  const ComponentRegistry *registry = nullptr;
  std::vector<std::string> scanner_names;
  std::shared_ptr<Logger> logger;
  ScanCoordinator *coordinator = nullptr;
};

class ScanPipelineBuilder {
public:
  explicit ScanPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  ScanPipelineBuilder &WithClassifier(std::unique_ptr<FileClassifier> classifier);
  ScanPipelineBuilder &WithLoader(std::unique_ptr<SourceLoader> loader);
  ScanPipelineBuilder &WithIndexer(std::unique_ptr<SchemaIndexer> indexer);
  ScanPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  ScanPipelineBuilder &WithCoordinator(ScanCoordinator &coordinator);
  // Restricts the run to a subset of the registered scanners.
  ScanPipelineBuilder &WithScannerNames(std::vector<std::string> names);

  DefaultScanPipeline Build();

private:
  PipelineComponents components_;
};

} // namespace tabledep
