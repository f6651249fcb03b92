#include <tabledep/scan_pipeline_builder.h>

#include <tabledep/default_scan_pipeline.h>
#include <tabledep/file_classifier.h>
#include <tabledep/schema_indexer.h>
#include <tabledep/source_loader.h>

#include <utility>

namespace tabledep {

ScanPipelineBuilder::ScanPipelineBuilder(const ComponentRegistry &registry) {
  components_.registry = &registry;
}

ScanPipelineBuilder &ScanPipelineBuilder::WithClassifier(
    std::unique_ptr<FileClassifier> classifier) {
  components_.classifier = std::move(classifier);
  return *this;
}

ScanPipelineBuilder &
ScanPipelineBuilder::WithLoader(std::unique_ptr<SourceLoader> loader) {
  components_.loader = std::move(loader);
  return *this;
}

ScanPipelineBuilder &
ScanPipelineBuilder::WithIndexer(std::unique_ptr<SchemaIndexer> indexer) {
  components_.indexer = std::move(indexer);
  return *this;
}

ScanPipelineBuilder &
ScanPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

ScanPipelineBuilder &
ScanPipelineBuilder::WithCoordinator(ScanCoordinator &coordinator) {
  components_.coordinator = &coordinator;
  return *this;
}

ScanPipelineBuilder &
ScanPipelineBuilder::WithScannerNames(std::vector<std::string> names) {
  components_.registry->ValidateScannerSelection(names);
  components_.scanner_names = std::move(names);
  return *this;
}

DefaultScanPipeline ScanPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.classifier) {
    components_.classifier =
        std::make_unique<FilesystemFileClassifier>(components_.logger);
  }
  if (!components_.loader) {
    components_.loader = std::make_unique<FileSourceLoader>(components_.logger);
  }
  if (!components_.indexer) {
    components_.indexer =
        std::make_unique<RailsSchemaIndexer>(components_.logger);
  }
  if (components_.coordinator == nullptr) {
    components_.coordinator = &GlobalScanCoordinator();
  }
  return DefaultScanPipeline(std::move(components_));
}

} // namespace tabledep
