#include <tabledep/models.h>

#include <gtest/gtest.h>

#include <stdexcept>

namespace tabledep {
namespace {

TEST(ModelsTest, ConfidenceIsTotallyOrdered) {
  EXPECT_LT(ConfidenceRank(Confidence::kLow),
            ConfidenceRank(Confidence::kMedium));
  EXPECT_LT(ConfidenceRank(Confidence::kMedium),
            ConfidenceRank(Confidence::kHigh));
}

TEST(ModelsTest, ParsesConfidenceCaseInsensitively) {
  EXPECT_EQ(Confidence::kHigh, ParseConfidence("HIGH"));
  EXPECT_EQ(Confidence::kMedium, ParseConfidence("medium"));
  EXPECT_EQ(Confidence::kLow, ParseConfidence("Low"));
  EXPECT_THROW(ParseConfidence("urgent"), std::invalid_argument);
}

TEST(ModelsTest, ReferenceKindsUseWireNames) {
  EXPECT_EQ("schema_reference", ReferenceKindName(ReferenceKind::kSchemaReference));
  EXPECT_EQ("migration_create_table_ref",
            ReferenceKindName(ReferenceKind::kMigrationCreateTableReference));
  EXPECT_EQ("raw_sql_column_ref",
            ReferenceKindName(ReferenceKind::kRawSqlColumnReference));
  EXPECT_EQ("polymorphic_model",
            ReferenceKindName(ReferenceKind::kPolymorphicModel));
}

TEST(ModelsTest, OnlyHasManyAndHasOneAreReverseAssociations) {
  EXPECT_TRUE(IsReverseAssociation(ReferenceKind::kModelHasManyReverse));
  EXPECT_TRUE(IsReverseAssociation(ReferenceKind::kModelHasOneReverse));
  EXPECT_FALSE(IsReverseAssociation(ReferenceKind::kModelBelongsTo));
  EXPECT_FALSE(IsReverseAssociation(ReferenceKind::kModelHasManyThrough));
}

TEST(ModelsTest, ScanTargetDerivesForeignKeyAndClassName) {
  const auto target = MakeScanTarget("reward_credits");

  EXPECT_EQ("reward_credits", target.table);
  EXPECT_EQ("reward_credit", target.singular);
  EXPECT_EQ("reward_credit_id", target.foreign_key);
  EXPECT_EQ("RewardCredit", target.class_name);
}

TEST(ModelsTest, ForeignKeyOverrideWinsOverPrimaryKey) {
  EXPECT_EQ("reward_uuid", MakeScanTarget("rewards", "", "uuid").foreign_key);
  EXPECT_EQ("prize_ref",
            MakeScanTarget("rewards", "prize_ref", "uuid").foreign_key);
}

TEST(ModelsTest, IdentityKeyIgnoresConfidenceAndColumn) {
  Evidence first{.file_path = "a.rb",
                 .line_number = 3,
                 .table_name = "orders",
                 .column_name = "reward_id",
                 .kind = ReferenceKind::kModelBelongsTo,
                 .confidence = Confidence::kHigh};
  Evidence second = first;
  second.column_name = "other";
  second.confidence = Confidence::kLow;

  EXPECT_EQ(first.IdentityKey(), second.IdentityKey());
}

TEST(ModelsTest, LoadedSourcesFindsOnlyLoadedPaths) {
  LoadedSources sources;
  sources.lines_by_path["db/schema.rb"] = {"line"};

  ASSERT_NE(nullptr, sources.Find("db/schema.rb"));
  EXPECT_EQ(1u, sources.Find("db/schema.rb")->size());
  EXPECT_EQ(nullptr, sources.Find("missing.rb"));
}

TEST(ModelsTest, PhaseNamesMatchProgressProtocol) {
  EXPECT_EQ("collecting", ScanPhaseName(ScanPhase::kCollecting));
  EXPECT_EQ("parsing_schema", ScanPhaseName(ScanPhase::kIndexingSchema));
  EXPECT_EQ("scanning", ScanPhaseName(ScanPhase::kScanning));
  EXPECT_EQ("processing", ScanPhaseName(ScanPhase::kPostProcessing));
}

} // namespace
} // namespace tabledep
