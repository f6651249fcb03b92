#pragma once

#include <tabledep/scan_pipeline_builder.h>

#include <memory>
#include <string>
#include <vector>

namespace tabledep {

// collecting -> parsing_schema -> scanning -> processing. Cancellation is
// polled between phases and between scanners; a cancelled run reports no
// evidence and empty statistics.
class DefaultScanPipeline : public ScanPipeline {
public:
  explicit DefaultScanPipeline(PipelineComponents components);

  ScanOutcome Run(const ScanRequest &request) override;

private:
  ScanOutcome Cancelled(const ScanRequest &request) const;

  std::unique_ptr<FileClassifier> classifier_;
  std::unique_ptr<SourceLoader> loader_;
  std::unique_ptr<SchemaIndexer> indexer_;
  const ComponentRegistry *registry_;
  std::vector<std::string> scanner_names_;
  std::shared_ptr<Logger> logger_;
  ScanCoordinator *coordinator_;
};

} // namespace tabledep
