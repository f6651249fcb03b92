#include <tabledep/default_scan_pipeline.h>
#include <tabledep/scan_pipeline_builder.h>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace tabledep {
namespace {

using ::testing::AllOf;
using ::testing::Each;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::Optional;
using ::testing::Pair;

using InMemoryFiles =
    std::map<std::string, std::pair<FileCategory, std::vector<std::string>>>;

class StubClassifier : public FileClassifier {
public:
  explicit StubClassifier(InMemoryFiles files) : files_(std::move(files)) {}

  CategorizedFiles Classify(const std::filesystem::path &) override {
    CategorizedFiles categorized;
    for (const auto &[path, entry] : files_) {
      categorized[entry.first].push_back(path);
    }
    return categorized;
  }

private:
  InMemoryFiles files_;
};

class StubLoader : public SourceLoader {
public:
  explicit StubLoader(InMemoryFiles files) : files_(std::move(files)) {}

  LoadedSources Load(const CategorizedFiles &) override {
    LoadedSources sources;
    for (const auto &[path, entry] : files_) {
      sources.lines_by_path[path] = entry.second;
    }
    return sources;
  }

private:
  InMemoryFiles files_;
};

InMemoryFiles RewardsProject() {
  return {
      {"/project/db/schema.rb",
       {FileCategory::kSchema,
        {"ActiveRecord::Schema.define(version: 2024_01_01) do",
         "  create_table \"businesses\", force: :cascade do |t|",
         "    t.string \"name\"",
         "  end",
         "  create_table \"orders\", force: :cascade do |t|",
         "    t.bigint \"reward_id\"",
         "  end",
         "  create_table \"rewards\", force: :cascade do |t|",
         "    t.bigint \"business_id\"",
         "  end",
         "  create_table \"widgets\", force: :cascade do |t|",
         "    t.references :reward",
         "  end",
         "end"}}},
      {"/project/app/models/order.rb",
       {FileCategory::kModel,
        {"class Order < ApplicationRecord", "  belongs_to :reward", "end"}}},
      {"/project/app/models/business.rb",
       {FileCategory::kModel,
        {"class Business < ApplicationRecord", "  has_many :rewards",
         "end"}}},
      {"/project/app/services/cleanup.rb",
       {FileCategory::kOtherSource,
        {"class Cleanup", "  def run",
         "    execute(\"DELETE FROM rewards WHERE expired\")", "  end",
         "end"}}},
  };
}

class ScanPipelineTest : public ::testing::Test {
protected:
  DefaultScanPipeline MakePipeline(
      std::vector<std::string> scanners = {"SchemaScanner",
                                           "AssociationScanner",
                                           "RawQueryScanner"}) {
    const auto files = RewardsProject();
    return ScanPipelineBuilder()
        .WithClassifier(std::make_unique<StubClassifier>(files))
        .WithLoader(std::make_unique<StubLoader>(files))
        .WithCoordinator(coordinator_)
        .WithScannerNames(std::move(scanners))
        .Build();
  }

  static ScanRequest RewardsRequest() {
    ScanRequest request;
    request.root_path = "/project";
    request.table_name = "rewards";
    return request;
  }

  ScanCoordinator coordinator_;
};

TEST_F(ScanPipelineTest, FindsChildTablesAndDropsReverseAndTargetEvidence) {
  auto pipeline = MakePipeline();

  const auto outcome = pipeline.Run(RewardsRequest());

  EXPECT_EQ(ScanStatus::kCompleted, outcome.status);
  EXPECT_THAT(
      outcome.evidence,
      ElementsAre(
          AllOf(Field(&Evidence::file_path, "app/models/order.rb"),
                Field(&Evidence::line_number, 2),
                Field(&Evidence::table_name, "orders"),
                Field(&Evidence::column_name, "reward_id"),
                Field(&Evidence::kind, ReferenceKind::kModelBelongsTo),
                Field(&Evidence::column_datatype,
                      Optional(std::string("bigint")))),
          AllOf(Field(&Evidence::file_path, "db/schema.rb"),
                Field(&Evidence::line_number, 6),
                Field(&Evidence::table_name, "orders"),
                Field(&Evidence::kind, ReferenceKind::kSchemaColumn)),
          AllOf(Field(&Evidence::file_path, "db/schema.rb"),
                Field(&Evidence::line_number, 12),
                Field(&Evidence::table_name, "widgets"),
                Field(&Evidence::column_name, "reward_id"),
                Field(&Evidence::kind, ReferenceKind::kSchemaReference))));
}

TEST_F(ScanPipelineTest, ReportsStatisticsPerStage) {
  auto pipeline = MakePipeline();

  const auto statistics = pipeline.Run(RewardsRequest()).statistics;

  EXPECT_EQ(4u, statistics.total_files_scanned);
  EXPECT_EQ(5u, statistics.raw_hits);
  EXPECT_EQ(5u, statistics.after_dedup);
  EXPECT_EQ(3u, statistics.after_validation);
  EXPECT_EQ(3u, statistics.after_filter);
  EXPECT_THAT(statistics.scanner_hits,
              ElementsAre(Pair("AssociationScanner", 2u),
                          Pair("RawQueryScanner", 1u),
                          Pair("SchemaScanner", 2u)));
}

TEST_F(ScanPipelineTest, MinimumConfidenceFiltersEvidence) {
  auto pipeline = MakePipeline({});
  auto request = RewardsRequest();
  request.min_confidence = Confidence::kHigh;

  const auto outcome = pipeline.Run(request);

  EXPECT_THAT(outcome.evidence,
              Each(Field(&Evidence::confidence, Confidence::kHigh)));
  EXPECT_EQ(outcome.evidence.size(), outcome.statistics.after_filter);
  EXPECT_LE(outcome.statistics.after_filter,
            outcome.statistics.after_validation);
}

TEST_F(ScanPipelineTest, ReportsPhasesInOrder) {
  auto pipeline = MakePipeline();
  std::vector<ScanPhase> phases;
  auto request = RewardsRequest();
  request.on_progress = [&phases](ScanPhase phase, const std::string &) {
    if (phases.empty() || phases.back() != phase) {
      phases.push_back(phase);
    }
  };

  pipeline.Run(request);

  EXPECT_THAT(phases, ElementsAre(ScanPhase::kCollecting,
                                  ScanPhase::kIndexingSchema,
                                  ScanPhase::kScanning,
                                  ScanPhase::kPostProcessing));
}

TEST_F(ScanPipelineTest, CancellationReturnsEmptyOutcome) {
  auto pipeline = MakePipeline();
  bool cancel = false;
  auto request = RewardsRequest();
  request.on_progress = [&cancel](ScanPhase phase, const std::string &) {
    if (phase == ScanPhase::kScanning) {
      cancel = true;
    }
  };
  request.is_cancelled = [&cancel]() { return cancel; };

  const auto outcome = pipeline.Run(request);

  EXPECT_EQ(ScanStatus::kCancelled, outcome.status);
  EXPECT_THAT(outcome.evidence, IsEmpty());
  EXPECT_EQ(0u, outcome.statistics.total_files_scanned);
  EXPECT_THAT(outcome.statistics.scanner_hits, IsEmpty());
  EXPECT_FALSE(coordinator_.busy());
}

TEST_F(ScanPipelineTest, RejectsSecondScanWhileOneIsActive) {
  auto outer = MakePipeline();
  auto inner = MakePipeline();
  bool rejected = false;
  auto request = RewardsRequest();
  request.on_progress = [&](ScanPhase phase, const std::string &) {
    if (phase != ScanPhase::kCollecting || rejected) {
      return;
    }
    EXPECT_TRUE(coordinator_.busy());
    EXPECT_THROW(inner.Run(RewardsRequest()), ScanInProgressError);
    rejected = true;
  };

  const auto outcome = outer.Run(request);

  EXPECT_TRUE(rejected);
  EXPECT_EQ(ScanStatus::kCompleted, outcome.status);
  EXPECT_FALSE(coordinator_.busy());
  EXPECT_EQ(3u, inner.Run(RewardsRequest()).evidence.size());
}

TEST_F(ScanPipelineTest, RequiresRootAndTable) {
  auto pipeline = MakePipeline();
  auto missing_table = RewardsRequest();
  missing_table.table_name.clear();
  auto missing_root = RewardsRequest();
  missing_root.root_path.clear();

  EXPECT_THROW(pipeline.Run(missing_table), std::invalid_argument);
  EXPECT_THROW(pipeline.Run(missing_root), std::invalid_argument);
  EXPECT_FALSE(coordinator_.busy());
}

TEST_F(ScanPipelineTest, BuilderRejectsUnknownScannerNames) {
  EXPECT_THROW(ScanPipelineBuilder().WithScannerNames({"NoSuchScanner"}),
               std::invalid_argument);
}

TEST(DefaultScanPipelineTest, RequiresEveryComponent) {
  PipelineComponents components;
  components.registry = &GlobalComponentRegistry();

  EXPECT_THROW(DefaultScanPipeline{std::move(components)},
               std::invalid_argument);
}

} // namespace
} // namespace tabledep
