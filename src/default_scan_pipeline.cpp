#include <tabledep/default_scan_pipeline.h>

#include <tabledep/evidence_reconciler.h>

#include <chrono>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace {

void ReportProgress(const tabledep::ScanRequest &request,
                    tabledep::ScanPhase phase, const std::string &detail) {
  if (request.on_progress) {
    request.on_progress(phase, detail);
  }
}

bool IsCancelled(const tabledep::ScanRequest &request) {
  return request.is_cancelled && request.is_cancelled();
}

void ValidateRequest(const tabledep::ScanRequest &request) {
  if (request.root_path.empty()) {
    throw std::invalid_argument("A scan root path is required.");
  }
  if (request.table_name.empty()) {
    throw std::invalid_argument("A target table name is required.");
  }
}

std::size_t CountFiles(const tabledep::CategorizedFiles &files) {
  std::size_t total = 0;
  for (const auto &[category, paths] : files) {
    total += paths.size();
  }
  return total;
}

} // namespace

namespace tabledep {

DefaultScanPipeline::DefaultScanPipeline(PipelineComponents components)
    : classifier_(std::move(components.classifier)),
      loader_(std::move(components.loader)),
      indexer_(std::move(components.indexer)),
      registry_(components.registry),
      scanner_names_(std::move(components.scanner_names)),
      logger_(EnsureLogger(std::move(components.logger))),
      coordinator_(components.coordinator) {
  if (!classifier_ || !loader_ || !indexer_ || registry_ == nullptr ||
      coordinator_ == nullptr) {
    throw std::invalid_argument("Scan pipeline is missing a component.");
  }
}

ScanOutcome DefaultScanPipeline::Cancelled(const ScanRequest &request) const {
  logger_->Log(LogLevel::kInfo, "scan.cancelled",
               {{"table", request.table_name}});
  ScanOutcome outcome;
  outcome.status = ScanStatus::kCancelled;
  return outcome;
}

ScanOutcome DefaultScanPipeline::Run(const ScanRequest &request) {
  ValidateRequest(request);
  const auto lease = coordinator_->Acquire();

  logger_->Log(LogLevel::kInfo, "scan.start",
               {{"root", request.root_path},
                {"table", request.table_name},
                {"min_confidence", ConfidenceName(request.min_confidence)}});
  const auto scan_start = std::chrono::steady_clock::now();
  ScanStatistics statistics;

  ReportProgress(request, ScanPhase::kCollecting, "Collecting files...");
  const auto files = classifier_->Classify(request.root_path);
  const auto sources = loader_->Load(files);
  statistics.total_files_scanned = CountFiles(files);
  logger_->Log(LogLevel::kDebug, "scan.stage.complete",
               {{"stage", ScanPhaseName(ScanPhase::kCollecting)},
                {"file_count", std::to_string(statistics.total_files_scanned)}});
  if (IsCancelled(request)) {
    return Cancelled(request);
  }

  ReportProgress(request, ScanPhase::kIndexingSchema, "Parsing schema...");
  const auto index = indexer_->BuildIndex(files, sources);
  logger_->Log(LogLevel::kDebug, "scan.stage.complete",
               {{"stage", ScanPhaseName(ScanPhase::kIndexingSchema)},
                {"tables", std::to_string(index.known_tables.size())}});
  if (IsCancelled(request)) {
    return Cancelled(request);
  }

  const auto target = MakeScanTarget(request.table_name, request.foreign_key,
                                     request.primary_key);
  const auto scanners =
      registry_->CreateScanners(target, index, scanner_names_);
  std::vector<Evidence> raw;
  for (const auto &scanner : scanners) {
    if (IsCancelled(request)) {
      return Cancelled(request);
    }
    const auto name = scanner->Name();
    logger_->Log(LogLevel::kDebug, "scan.phase",
                 {{"phase", ScanPhaseName(ScanPhase::kScanning)},
                  {"scanner", name}});
    ReportProgress(request, ScanPhase::kScanning, "Running " + name + "...");
    auto found = scanner->ScanAll(files, sources);
    if (!found.empty()) {
      statistics.scanner_hits[name] = found.size();
    }
    raw.insert(raw.end(), std::make_move_iterator(found.begin()),
               std::make_move_iterator(found.end()));
  }
  statistics.raw_hits = raw.size();
  if (IsCancelled(request)) {
    return Cancelled(request);
  }

  ReportProgress(request, ScanPhase::kPostProcessing,
                 "Deduplicating and filtering results...");
  auto evidence = Deduplicate(raw);
  statistics.after_dedup = evidence.size();
  evidence = DropReverseAssociations(evidence);
  evidence = FilterKnownTables(evidence, index, target.table);
  evidence = ValidateAgainstSchema(evidence, index, request.validation);
  statistics.after_validation = evidence.size();
  evidence = FilterByConfidence(evidence, request.min_confidence);
  statistics.after_filter = evidence.size();
  Rank(evidence);
  RelativizePaths(evidence,
                  std::filesystem::weakly_canonical(request.root_path).string());
  logger_->Log(LogLevel::kDebug, "scan.stage.complete",
               {{"stage", ScanPhaseName(ScanPhase::kPostProcessing)},
                {"evidence", std::to_string(evidence.size())}});

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - scan_start)
          .count();
  logger_->Log(LogLevel::kInfo, "scan.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"raw_hits", std::to_string(statistics.raw_hits)},
                {"evidence", std::to_string(evidence.size())}});

  return ScanOutcome{ScanStatus::kCompleted, std::move(evidence),
                     std::move(statistics)};
}

} // namespace tabledep
