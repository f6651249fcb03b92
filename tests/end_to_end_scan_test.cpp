#include <tabledep/default_scan_pipeline.h>
#include <tabledep/scan_pipeline_builder.h>
#include <tabledep/tabular_reporter.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace tabledep {
namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;

void WriteRewardsApplication(const test::TemporaryProject &project) {
  project.AddFile("db/schema.rb",
                  "ActiveRecord::Schema[7.1].define(version: 2024_05_01_000000) do\n"
                  "  create_table \"comments\", force: :cascade do |t|\n"
                  "    t.string \"commentable_type\"\n"
                  "    t.bigint \"commentable_id\"\n"
                  "  end\n"
                  "\n"
                  "  create_table \"orders\", force: :cascade do |t|\n"
                  "    t.bigint \"reward_id\", null: false\n"
                  "    t.string \"status\"\n"
                  "  end\n"
                  "\n"
                  "  create_table \"payouts\", force: :cascade do |t|\n"
                  "    t.integer \"reward_id\"\n"
                  "  end\n"
                  "\n"
                  "  create_table \"rewards\", force: :cascade do |t|\n"
                  "    t.string \"name\"\n"
                  "  end\n"
                  "\n"
                  "  add_foreign_key \"orders\", \"rewards\"\n"
                  "end\n");
  project.AddFile("db/migrate/20240501000000_create_orders.rb",
                  "class CreateOrders < ActiveRecord::Migration[7.1]\n"
                  "  def change\n"
                  "    create_table :orders do |t|\n"
                  "      t.references :reward, null: false, foreign_key: true\n"
                  "    end\n"
                  "  end\n"
                  "end\n");
  project.AddFile("app/models/order.rb", "class Order < ApplicationRecord\n"
                                         "  belongs_to :reward\n"
                                         "end\n");
  project.AddFile("app/models/business.rb",
                  "class Business < ApplicationRecord\n"
                  "  has_many :rewards\n"
                  "end\n");
  project.AddFile("app/models/payout.rb",
                  "class Payout < ApplicationRecord\n"
                  "  belongs_to :bonus, class_name: \"Reward\", foreign_key: "
                  "\"legacy_reward_ref\"\n"
                  "end\n");
  project.AddFile("app/services/comment_cleanup.rb",
                  "class CommentCleanup\n"
                  "  def call\n"
                  "    Comment.where(commentable_type: \"Reward\").delete_all\n"
                  "  end\n"
                  "end\n");
  project.AddFile("app/queries/payout_report.sql",
                  "SELECT payouts.* FROM payouts\n"
                  "JOIN rewards ON payouts.reward_id = rewards.id\n");
  project.AddFile("config/archive.yml", "archived_tables: rewards\n");
  project.AddFile("vendor/engine/app/models/order.rb",
                  "class Order < ApplicationRecord\n"
                  "  belongs_to :reward\n"
                  "end\n");
  project.AddFile("README.md", "Orders belong to rewards.\n");
}

class EndToEndScanTest : public ::testing::Test {
protected:
  void SetUp() override { WriteRewardsApplication(project_); }

  ScanOutcome Scan(ValidationMode validation,
                   Confidence min_confidence = Confidence::kLow) {
    auto pipeline = ScanPipelineBuilder().WithCoordinator(coordinator_).Build();
    ScanRequest request;
    request.root_path = project_.root().string();
    request.table_name = "rewards";
    request.min_confidence = min_confidence;
    request.validation = validation;
    return pipeline.Run(request);
  }

  test::TemporaryProject project_;
  ScanCoordinator coordinator_;
};

TEST_F(EndToEndScanTest, ReportsEveryDependentTableRankedByConfidence) {
  const auto outcome = Scan(ValidationMode::kLenient);

  ASSERT_EQ(ScanStatus::kCompleted, outcome.status);
  EXPECT_THAT(
      outcome.evidence,
      ElementsAre(
          AllOf(Field(&Evidence::file_path, "app/models/order.rb"),
                Field(&Evidence::line_number, 2),
                Field(&Evidence::kind, ReferenceKind::kModelBelongsTo)),
          AllOf(Field(&Evidence::file_path,
                      "db/migrate/20240501000000_create_orders.rb"),
                Field(&Evidence::line_number, 4),
                Field(&Evidence::table_name, "orders"),
                Field(&Evidence::kind,
                      ReferenceKind::kMigrationCreateTableReference)),
          AllOf(Field(&Evidence::file_path, "db/schema.rb"),
                Field(&Evidence::line_number, 8),
                Field(&Evidence::table_name, "orders")),
          AllOf(Field(&Evidence::file_path, "db/schema.rb"),
                Field(&Evidence::line_number, 13),
                Field(&Evidence::table_name, "payouts")),
          AllOf(Field(&Evidence::file_path, "app/queries/payout_report.sql"),
                Field(&Evidence::line_number, 2),
                Field(&Evidence::table_name, "payouts"),
                Field(&Evidence::column_name, "reward_id"),
                Field(&Evidence::kind, ReferenceKind::kRawSqlJoin)),
          AllOf(Field(&Evidence::file_path, "db/schema.rb"),
                Field(&Evidence::line_number, 4),
                Field(&Evidence::table_name, "comments"),
                Field(&Evidence::column_name, "commentable_id"),
                Field(&Evidence::kind, ReferenceKind::kPolymorphicSchema),
                Field(&Evidence::confidence, Confidence::kMedium)),
          AllOf(Field(&Evidence::file_path, "app/models/payout.rb"),
                Field(&Evidence::table_name, "payouts"),
                Field(&Evidence::column_name, "legacy_reward_ref"),
                Field(&Evidence::confidence, Confidence::kLow),
                Field(&Evidence::schema_verified, false))));
}

TEST_F(EndToEndScanTest, StrictModeDropsUnverifiedColumns) {
  const auto outcome = Scan(ValidationMode::kStrict);

  EXPECT_EQ(6u, outcome.evidence.size());
  EXPECT_TRUE(std::none_of(
      outcome.evidence.begin(), outcome.evidence.end(),
      [](const Evidence &item) { return !item.schema_verified; }));
}

TEST_F(EndToEndScanTest, SkipsVendoredAndUnscannedFiles) {
  const auto outcome = Scan(ValidationMode::kLenient);

  EXPECT_EQ(8u, outcome.statistics.total_files_scanned);
  EXPECT_TRUE(std::none_of(outcome.evidence.begin(), outcome.evidence.end(),
                           [](const Evidence &item) {
                             return item.file_path.rfind("vendor/", 0) == 0;
                           }));
}

TEST_F(EndToEndScanTest, RendersReportsForTheScan) {
  const auto outcome = Scan(ValidationMode::kLenient, Confidence::kHigh);
  TabularReporter reporter;
  const ReportConfig config{.root_path = project_.root().string(),
                            .table_name = "rewards",
                            .min_confidence = Confidence::kHigh,
                            .formats = {"csv", "markdown"}};

  const auto report = reporter.Render(outcome, config);

  EXPECT_EQ(4, std::count(report.csv.begin(), report.csv.end(), '\n') - 1);
  EXPECT_THAT(report.csv, HasSubstr("app/models/order.rb,2,orders,reward_id,"
                                    "model_belongs_to,belongs_to :reward,"
                                    "HIGH,True"));
  EXPECT_THAT(report.markdown, HasSubstr("| Reported | 4 |"));
}

} // namespace
} // namespace tabledep
