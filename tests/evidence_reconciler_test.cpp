#include <tabledep/evidence_reconciler.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace tabledep {
namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::Optional;

Evidence MakeItem(std::string path, int line, std::string table,
                  std::string column, ReferenceKind kind,
                  Confidence confidence) {
  Evidence item;
  item.file_path = std::move(path);
  item.line_number = line;
  item.table_name = std::move(table);
  item.column_name = std::move(column);
  item.kind = kind;
  item.confidence = confidence;
  return item;
}

SchemaIndex MakeIndex() {
  SchemaIndex index;
  index.known_tables = {"orders", "rewards", "payouts"};
  index.columns["orders"] = {{"reward_id", "bigint"}};
  index.columns["payouts"] = {{"amount", "decimal"}};
  index.columns["rewards"] = {};
  return index;
}

TEST(DeduplicateTest, KeepsFirstSeenUnlessStrictlyMoreConfident) {
  const auto evidence = Deduplicate(
      {MakeItem("a.rb", 1, "orders", "first", ReferenceKind::kRawSqlJoin,
                Confidence::kMedium),
       MakeItem("b.rb", 2, "orders", "", ReferenceKind::kRawSqlJoin,
                Confidence::kLow),
       MakeItem("a.rb", 1, "orders", "tie", ReferenceKind::kRawSqlJoin,
                Confidence::kMedium),
       MakeItem("a.rb", 1, "orders", "better", ReferenceKind::kRawSqlJoin,
                Confidence::kHigh),
       MakeItem("a.rb", 1, "orders", "other kind",
                ReferenceKind::kRawSqlTableReference, Confidence::kLow)});

  EXPECT_THAT(evidence,
              ElementsAre(AllOf(Field(&Evidence::column_name, "better"),
                                Field(&Evidence::confidence,
                                      Confidence::kHigh)),
                          Field(&Evidence::file_path, "b.rb"),
                          Field(&Evidence::column_name, "other kind")));
}

TEST(DropReverseAssociationsTest, RemovesHasManyAndHasOne) {
  const auto evidence = DropReverseAssociations(
      {MakeItem("m.rb", 1, "rewards", "business_id",
                ReferenceKind::kModelHasManyReverse, Confidence::kHigh),
       MakeItem("m.rb", 2, "rewards", "business_id",
                ReferenceKind::kModelHasOneReverse, Confidence::kHigh),
       MakeItem("m.rb", 3, "orders", "reward_id",
                ReferenceKind::kModelBelongsTo, Confidence::kHigh)});

  EXPECT_THAT(evidence, ElementsAre(Field(&Evidence::line_number, 3)));
}

TEST(FilterKnownTablesTest, KeepsKnownTablesAndDropsTarget) {
  const auto evidence = FilterKnownTables(
      {MakeItem("a", 1, "orders", "", ReferenceKind::kRawSqlJoin,
                Confidence::kLow),
       MakeItem("a", 2, "ghosts", "", ReferenceKind::kRawSqlJoin,
                Confidence::kLow),
       MakeItem("a", 3, "rewards", "", ReferenceKind::kRawSqlJoin,
                Confidence::kLow)},
      MakeIndex(), "rewards");

  EXPECT_THAT(evidence, ElementsAre(Field(&Evidence::table_name, "orders")));
}

TEST(FilterKnownTablesTest, WithoutSchemaOnlyTargetIsDropped) {
  const auto evidence = FilterKnownTables(
      {MakeItem("a", 1, "ghosts", "", ReferenceKind::kRawSqlJoin,
                Confidence::kLow),
       MakeItem("a", 2, "rewards", "", ReferenceKind::kRawSqlJoin,
                Confidence::kLow)},
      SchemaIndex{}, "rewards");

  EXPECT_THAT(evidence, ElementsAre(Field(&Evidence::table_name, "ghosts")));
}

TEST(ValidateAgainstSchemaTest, AttachesDatatypeForKnownColumns) {
  const auto evidence = ValidateAgainstSchema(
      {MakeItem("m.rb", 1, "orders", "reward_id",
                ReferenceKind::kModelBelongsTo, Confidence::kHigh)},
      MakeIndex(), ValidationMode::kStrict);

  ASSERT_EQ(1u, evidence.size());
  EXPECT_THAT(evidence[0].column_datatype, Optional(std::string("bigint")));
  EXPECT_TRUE(evidence[0].schema_verified);
  EXPECT_EQ(Confidence::kHigh, evidence[0].confidence);
}

TEST(ValidateAgainstSchemaTest, LenientModeDowngradesMissingColumns) {
  const auto evidence = ValidateAgainstSchema(
      {MakeItem("m.rb", 1, "payouts", "legacy_reward_ref",
                ReferenceKind::kModelIndirectAssociation, Confidence::kHigh)},
      MakeIndex(), ValidationMode::kLenient);

  ASSERT_EQ(1u, evidence.size());
  EXPECT_FALSE(evidence[0].schema_verified);
  EXPECT_EQ(Confidence::kLow, evidence[0].confidence);
  EXPECT_FALSE(evidence[0].column_datatype.has_value());
}

TEST(ValidateAgainstSchemaTest, StrictModeDropsMissingColumns) {
  EXPECT_THAT(ValidateAgainstSchema(
                  {MakeItem("m.rb", 1, "payouts", "legacy_reward_ref",
                            ReferenceKind::kModelIndirectAssociation,
                            Confidence::kHigh)},
                  MakeIndex(), ValidationMode::kStrict),
              IsEmpty());
}

TEST(ValidateAgainstSchemaTest, PassesThroughTableLevelAndUnmappedEvidence) {
  const std::vector<Evidence> input = {
      MakeItem("q.rb", 1, "payouts", "", ReferenceKind::kRawSqlTableReference,
               Confidence::kHigh),
      MakeItem("q.rb", 2, "ghosts", "reward_id", ReferenceKind::kRawSqlJoin,
               Confidence::kMedium)};

  const auto evidence =
      ValidateAgainstSchema(input, MakeIndex(), ValidationMode::kStrict);

  EXPECT_THAT(evidence,
              ElementsAre(Field(&Evidence::schema_verified, true),
                          Field(&Evidence::schema_verified, true)));
}

TEST(ValidateAgainstSchemaTest, EmptyColumnMapDisablesValidation) {
  const auto evidence = ValidateAgainstSchema(
      {MakeItem("m.rb", 1, "payouts", "anything", ReferenceKind::kRawSqlJoin,
                Confidence::kHigh)},
      SchemaIndex{}, ValidationMode::kStrict);

  EXPECT_THAT(evidence, ElementsAre(Field(&Evidence::confidence,
                                          Confidence::kHigh)));
}

TEST(FilterByConfidenceTest, KeepsEvidenceAtOrAboveMinimum) {
  const auto evidence = FilterByConfidence(
      {MakeItem("a", 1, "t", "", ReferenceKind::kRawSqlJoin, Confidence::kLow),
       MakeItem("a", 2, "t", "", ReferenceKind::kRawSqlJoin,
                Confidence::kMedium),
       MakeItem("a", 3, "t", "", ReferenceKind::kRawSqlJoin,
                Confidence::kHigh)},
      Confidence::kMedium);

  EXPECT_THAT(evidence, ElementsAre(Field(&Evidence::line_number, 2),
                                    Field(&Evidence::line_number, 3)));
}

TEST(RankTest, OrdersByConfidenceThenPathThenLine) {
  std::vector<Evidence> evidence = {
      MakeItem("b.rb", 1, "t", "", ReferenceKind::kRawSqlJoin,
               Confidence::kMedium),
      MakeItem("a.rb", 9, "t", "", ReferenceKind::kRawSqlJoin,
               Confidence::kHigh),
      MakeItem("a.rb", 5, "t", "", ReferenceKind::kRawSqlJoin,
               Confidence::kMedium),
      MakeItem("a.rb", 2, "t", "", ReferenceKind::kRawSqlJoin,
               Confidence::kLow),
      MakeItem("a.rb", 5, "t", "tie", ReferenceKind::kRawSqlTableReference,
               Confidence::kMedium)};

  Rank(evidence);

  EXPECT_THAT(
      evidence,
      ElementsAre(AllOf(Field(&Evidence::file_path, "a.rb"),
                        Field(&Evidence::line_number, 9)),
                  AllOf(Field(&Evidence::line_number, 5),
                        Field(&Evidence::column_name, "")),
                  AllOf(Field(&Evidence::line_number, 5),
                        Field(&Evidence::column_name, "tie")),
                  Field(&Evidence::file_path, "b.rb"),
                  Field(&Evidence::confidence, Confidence::kLow)));
}

TEST(RelativizePathsTest, StripsRootAndFollowingSeparators) {
  std::vector<Evidence> evidence = {
      MakeItem("/srv/app/app/models/order.rb", 1, "t", "",
               ReferenceKind::kRawSqlJoin, Confidence::kLow),
      MakeItem("/elsewhere/x.rb", 1, "t", "", ReferenceKind::kRawSqlJoin,
               Confidence::kLow)};

  RelativizePaths(evidence, "/srv/app");

  EXPECT_EQ("app/models/order.rb", evidence[0].file_path);
  EXPECT_EQ("/elsewhere/x.rb", evidence[1].file_path);
}

TEST(RelativizePathsTest, EmptyRootLeavesAbsolutePathsAlone) {
  std::vector<Evidence> evidence = {MakeItem(
      "/srv/app/x.rb", 1, "t", "", ReferenceKind::kRawSqlJoin,
      Confidence::kLow)};

  RelativizePaths(evidence, "");

  EXPECT_EQ("/srv/app/x.rb", evidence[0].file_path);
}

} // namespace
} // namespace tabledep
