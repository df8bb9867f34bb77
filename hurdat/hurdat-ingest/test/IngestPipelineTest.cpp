// Ticket: 0008_ingest_pipeline

#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>

#include "hurdat-db/src/ColumnarTableStore.hpp"
#include "hurdat-db/src/Database.hpp"
#include "hurdat-ingest/src/IngestPipeline.hpp"
#include "hurdat-parse/src/ParseErrors.hpp"
#include "hurdat-parse/test/Helpers/HurdatLineBuilder.hpp"

namespace hurdat_ingest::test
{

class IngestPipelineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>("ingest_test", nullSink);

    dbPath_ = (std::filesystem::temp_directory_path() /
               ("hurdat_ingest_test_" +
                std::to_string(
                  std::chrono::steady_clock::now().time_since_epoch().count()) +
                ".db"))
                .string();
  }

  void TearDown() override
  {
    std::filesystem::remove(dbPath_);
  }

  IngestPipeline::Config sampleConfig() const
  {
    IngestPipeline::Config config{};
    config.inputPath = std::string{HURDAT_TEST_DATA_DIR} + "/hurdat2_sample.txt";
    config.databaseLogger = logger_;
    return config;
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::string dbPath_;
};

// ============================================================================
// Sample File Tests
// ============================================================================

TEST_F(IngestPipelineTest, SampleFile_ProducesOneRowPerDataLine)
{
  IngestPipeline pipeline{sampleConfig()};
  auto const result = pipeline.run();

  EXPECT_EQ(result.storms, 4u);
  EXPECT_EQ(result.records, 28u);
  EXPECT_EQ(result.table.rowCount(), 28u);
  EXPECT_EQ(result.table.columnCount(), 30u);
  EXPECT_TRUE(result.droppedColumns.empty());
}

TEST_F(IngestPipelineTest, SampleFile_UniqueIdsFollowHeaderBlocks)
{
  IngestPipeline pipeline{sampleConfig()};
  auto const result = pipeline.run();

  const auto& ids = result.table.column("unique_id");
  EXPECT_EQ(std::get<std::string>(ids.front()), "1851AL01");
  EXPECT_EQ(std::get<std::string>(ids[14]), "1851AL02");
  EXPECT_EQ(std::get<std::string>(ids[15]), "2005AL30");
  // Zeta keeps its 2005 identifier after the new year
  EXPECT_EQ(std::get<std::string>(ids[22]), "2005AL30");
  EXPECT_EQ(std::get<std::string>(ids.back()), "2021AL09");
}

TEST_F(IngestPipelineTest, SampleFile_YearBoundaryMismatchesAreExpected)
{
  auto config = sampleConfig();
  config.failOnUnexpectedMismatch = true;

  IngestPipeline pipeline{config};
  auto const result = pipeline.run();

  ASSERT_EQ(result.report.mismatches.size(), 2u);
  EXPECT_EQ(result.report.expectedCount(), 2u);
  EXPECT_EQ(result.report.mismatches[0].identity.name, "ZETA");
  EXPECT_EQ(result.report.mismatches[0].identity.year, 2005);
  EXPECT_EQ(result.report.mismatches[1].identity.year, 2006);
}

TEST_F(IngestPipelineTest, SampleFile_SentinelsAndRadiiAreTyped)
{
  IngestPipeline pipeline{sampleConfig()};
  auto const result = pipeline.run();

  const auto& pressure = result.table.column("min_pressure");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(pressure.front()));
  EXPECT_EQ(std::get<std::int64_t>(pressure.back()), 987);

  const auto& radii = result.table.column("wind_radii_34_ne");
  EXPECT_EQ(std::get<std::int64_t>(radii[23]), 130);

  const auto& rmw = result.table.column("radius_max_wind");
  EXPECT_EQ(std::get<std::int64_t>(rmw.back()), 50);

  const auto& identifiers = result.table.column("record_identifier");
  EXPECT_EQ(std::get<std::string>(identifiers[4]), "L");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(identifiers[0]));

  const auto& longitude = result.table.column("longitude");
  EXPECT_DOUBLE_EQ(std::get<double>(longitude.front()), -94.8);
}

TEST_F(IngestPipelineTest, DropUninformativeColumns_RemovesConstantBasin)
{
  auto config = sampleConfig();
  config.dropUninformativeColumns = true;

  IngestPipeline pipeline{config};
  auto const result = pipeline.run();

  EXPECT_EQ(result.droppedColumns, std::vector<std::string>{"basin"});
  EXPECT_EQ(result.table.columnCount(), 29u);
  EXPECT_FALSE(result.table.columnIndex("basin").has_value());
}

TEST_F(IngestPipelineTest, DropUninformativeColumns_SingleRowKeepsTable)
{
  using hurdat_parse::test::makeDataLine;
  using hurdat_parse::test::makeHeaderLine;

  std::vector<std::string> lines{makeHeaderLine("AL", "01", "1851", "UNNAMED", "1"),
                                 makeDataLine("18510625", "0000")};

  auto config = sampleConfig();
  config.dropUninformativeColumns = true;
  config.databasePath = dbPath_;
  config.tableName = "single";

  IngestPipeline pipeline{config};
  auto const result =
    pipeline.run(std::make_unique<hurdat_parse::MemoryLineCursor>(lines));

  EXPECT_TRUE(result.droppedColumns.empty());
  EXPECT_EQ(result.table.columnCount(), 30u);
  ASSERT_EQ(result.table.rowCount(), 1u);

  hurdat_db::Database db{dbPath_, logger_, hurdat_db::DBOpenCondition::OpenReadOnly};
  hurdat_db::ColumnarTableStore store{db};
  auto const loaded = store.read("single");
  EXPECT_EQ(loaded.rowCount(), result.table.rowCount());
  EXPECT_EQ(loaded, result.table);
}

TEST_F(IngestPipelineTest, DatabasePath_StoresTableThatReadsBack)
{
  auto config = sampleConfig();
  config.databasePath = dbPath_;
  config.tableName = "atlantic";

  IngestPipeline pipeline{config};
  auto const result = pipeline.run();

  hurdat_db::Database db{dbPath_, logger_, hurdat_db::DBOpenCondition::OpenReadOnly};
  hurdat_db::ColumnarTableStore store{db};
  ASSERT_TRUE(store.exists("atlantic"));
  EXPECT_EQ(store.read("atlantic"), result.table);
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(IngestPipelineTest, MissingInputFile_Throws)
{
  auto config = sampleConfig();
  config.inputPath = "/nonexistent/hurdat2.txt";

  IngestPipeline pipeline{config};
  EXPECT_THROW(static_cast<void>(pipeline.run()), std::runtime_error);
}

TEST_F(IngestPipelineTest, TruncatedInput_PropagatesParseError)
{
  using hurdat_parse::test::makeDataLine;
  using hurdat_parse::test::makeHeaderLine;

  std::vector<std::string> lines{makeHeaderLine("AL", "01", "1851", "UNNAMED", "2"),
                                 makeDataLine("18510625", "0000")};

  IngestPipeline pipeline{sampleConfig()};
  EXPECT_THROW(static_cast<void>(pipeline.run(
                 std::make_unique<hurdat_parse::MemoryLineCursor>(lines))),
               hurdat_parse::TruncatedStormError);
}

TEST_F(IngestPipelineTest, UnknownStatusPolicyIsForwardedToNormalizer)
{
  using hurdat_parse::test::DataLineFields;
  using hurdat_parse::test::makeDataLine;
  using hurdat_parse::test::makeHeaderLine;

  DataLineFields fields{};
  fields.status = "ZZ";
  std::vector<std::string> lines{makeHeaderLine("AL", "01", "1851", "UNNAMED", "1"),
                                 makeDataLine(fields)};

  IngestPipeline strict{sampleConfig()};
  EXPECT_THROW(static_cast<void>(strict.run(
                 std::make_unique<hurdat_parse::MemoryLineCursor>(lines))),
               hurdat_parse::UnknownStatusError);

  auto config = sampleConfig();
  config.normalizer.unknownStatus = hurdat_schema::FailurePolicy::MarkMissing;
  IngestPipeline lenient{config};
  auto const result =
    lenient.run(std::make_unique<hurdat_parse::MemoryLineCursor>(lines));
  ASSERT_EQ(result.table.rowCount(), 1u);
  EXPECT_TRUE(
    std::holds_alternative<std::monostate>(result.table.column("status")[0]));
}

}  // namespace hurdat_ingest::test
