// Ticket: 0004_schema_normalizer

#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "hurdat-parse/src/CoordinateConverter.hpp"
#include "hurdat-parse/src/DataLineParser.hpp"
#include "hurdat-parse/src/HeaderLineParser.hpp"
#include "hurdat-parse/src/ParseErrors.hpp"
#include "hurdat-parse/test/Helpers/HurdatLineBuilder.hpp"
#include "hurdat-schema/src/SchemaNormalizer.hpp"

namespace hurdat_schema::test
{

using hurdat_parse::test::DataLineFields;
using hurdat_parse::test::makeDataLine;
using hurdat_parse::test::makeHeaderLine;

class SchemaNormalizerTest : public ::testing::Test
{
protected:
  static hurdat_parse::CompositeRecord makeRecord(const DataLineFields& fields)
  {
    hurdat_parse::CompositeRecord record{};
    record.header = hurdat_parse::parseHeaderLine(
      makeHeaderLine("AL", "09", "2021", "IDA", "1"), 1);
    record.point = hurdat_parse::parseDataLine(makeDataLine(fields), 2);
    record.latitude =
      hurdat_parse::toSignedDegrees(record.point.latitudeMagnitude,
                                    record.point.latitudeHemisphere,
                                    hurdat_parse::CoordinateAxis::Latitude);
    record.longitude =
      hurdat_parse::toSignedDegrees(record.point.longitudeMagnitude,
                                    record.point.longitudeHemisphere,
                                    hurdat_parse::CoordinateAxis::Longitude);
    record.observationYear = 2021;
    record.lineNumber = 2;
    return record;
  }

  static DataLineFields idaLandfall()
  {
    DataLineFields fields{};
    fields.date = "20210829";
    fields.time = "1655";
    fields.recordIdentifier = "L";
    fields.status = "HU";
    fields.latitude = "29.1";
    fields.longitude = "90.2";
    fields.maxWind = "130";
    fields.minPressure = "931";
    fields.windRadii = {
      "130", "110", "80", "110", "60", "50", "40", "50", "45", "35", "25", "35"};
    fields.radiusMaxWind = "10";
    return fields;
  }
};

// ============================================================================
// Field Conversion Tests
// ============================================================================

TEST_F(SchemaNormalizerTest, CopiesHeaderFieldsOntoEveryPoint)
{
  SchemaNormalizer normalizer{};
  auto const point = normalizer.normalize(makeRecord(idaLandfall()));

  EXPECT_EQ(point.uniqueId, "2021AL09");
  EXPECT_EQ(point.basin, "AL");
  EXPECT_EQ(point.cycloneNumber, "09");
  EXPECT_EQ(point.stormYear, 2021);
  EXPECT_EQ(point.name, "IDA");
}

TEST_F(SchemaNormalizerTest, ComposesUtcTimestampFromDateAndTime)
{
  using namespace std::chrono;

  SchemaNormalizer normalizer{};
  auto const point = normalizer.normalize(makeRecord(idaLandfall()));

  EXPECT_EQ(point.year, 2021);
  EXPECT_EQ(point.month, 8);
  EXPECT_EQ(point.day, 29);
  EXPECT_EQ(point.hour, 16);
  EXPECT_EQ(point.minute, 55);

  sys_seconds const expected =
    sys_days{2021y / August / 29} + hours{16} + minutes{55};
  ASSERT_TRUE(point.timestamp.has_value());
  EXPECT_EQ(*point.timestamp, expected);
  EXPECT_EQ(point.timestamp->time_since_epoch().count(), 1630256100);
}

TEST_F(SchemaNormalizerTest, ConvertsCodesCoordinatesAndMeasurements)
{
  SchemaNormalizer normalizer{};
  auto const point = normalizer.normalize(makeRecord(idaLandfall()));

  EXPECT_EQ(point.recordIdentifier, 'L');
  EXPECT_EQ(point.status, StormStatus::HU);
  EXPECT_DOUBLE_EQ(point.latitude, 29.1);
  EXPECT_DOUBLE_EQ(point.longitude, -90.2);
  EXPECT_EQ(point.maxWind, 130);
  EXPECT_EQ(point.minPressure, 931);
  EXPECT_EQ(point.windRadii[0], 130);
  EXPECT_EQ(point.windRadii[2], 80);
  EXPECT_EQ(point.windRadii[11], 35);
  EXPECT_EQ(point.radiusMaxWind, 10);
}

TEST_F(SchemaNormalizerTest, BlankRecordIdentifierIsMissing)
{
  auto fields = idaLandfall();
  fields.recordIdentifier = " ";

  SchemaNormalizer normalizer{};
  EXPECT_FALSE(normalizer.normalize(makeRecord(fields))
                 .recordIdentifier.has_value());
}

// ============================================================================
// Sentinel Tests
// ============================================================================

TEST_F(SchemaNormalizerTest, SentinelsBecomeMissingByDefault)
{
  DataLineFields fields{};
  fields.maxWind = "-99";

  SchemaNormalizer normalizer{};
  auto const point = normalizer.normalize(makeRecord(fields));

  EXPECT_FALSE(point.maxWind.has_value());
  EXPECT_FALSE(point.minPressure.has_value());
  EXPECT_FALSE(point.radiusMaxWind.has_value());
  for (const auto& radius : point.windRadii)
  {
    EXPECT_FALSE(radius.has_value());
  }
}

TEST_F(SchemaNormalizerTest, PreserveLiteralKeepsSentinelValues)
{
  NormalizerOptions options{};
  options.sentinels = SentinelPolicy::PreserveLiteral;

  SchemaNormalizer normalizer{options};
  auto const point = normalizer.normalize(makeRecord(DataLineFields{}));

  EXPECT_EQ(point.minPressure, -999);
  EXPECT_EQ(point.radiusMaxWind, -999);
}

TEST_F(SchemaNormalizerTest, CoerceMeasurement_BlankAndGarbageAreMissing)
{
  SchemaNormalizer normalizer{};
  EXPECT_FALSE(normalizer.coerceMeasurement("    ").has_value());
  EXPECT_FALSE(normalizer.coerceMeasurement("1x").has_value());
  EXPECT_EQ(normalizer.coerceMeasurement("   0"), 0);
}

// ============================================================================
// Failure Policy Tests
// ============================================================================

TEST_F(SchemaNormalizerTest, UnknownStatus_ThrowsByDefault)
{
  auto fields = idaLandfall();
  fields.status = "XX";

  SchemaNormalizer normalizer{};
  try
  {
    static_cast<void>(normalizer.normalize(makeRecord(fields)));
    FAIL() << "Expected UnknownStatusError";
  }
  catch (const hurdat_parse::UnknownStatusError& e)
  {
    EXPECT_EQ(e.lineNumber(), 2u);
    ASSERT_TRUE(e.storm().has_value());
    EXPECT_EQ(e.storm()->name, "IDA");
  }
}

TEST_F(SchemaNormalizerTest, UnknownStatus_MarkMissingLeavesStatusEmpty)
{
  auto fields = idaLandfall();
  fields.status = "XX";

  NormalizerOptions options{};
  options.unknownStatus = FailurePolicy::MarkMissing;

  SchemaNormalizer normalizer{options};
  auto const point = normalizer.normalize(makeRecord(fields));
  EXPECT_FALSE(point.status.has_value());
  EXPECT_EQ(point.maxWind, 130);
}

TEST_F(SchemaNormalizerTest, ImpossibleDate_ThrowsByDefault)
{
  auto fields = idaLandfall();
  fields.date = "20210230";

  SchemaNormalizer normalizer{};
  EXPECT_THROW(static_cast<void>(normalizer.normalize(makeRecord(fields))),
               hurdat_parse::InvalidDateError);
}

TEST_F(SchemaNormalizerTest, ImpossibleDate_MarkMissingKeepsDateParts)
{
  auto fields = idaLandfall();
  fields.date = "20210230";

  NormalizerOptions options{};
  options.invalidDate = FailurePolicy::MarkMissing;

  SchemaNormalizer normalizer{options};
  auto const point = normalizer.normalize(makeRecord(fields));
  EXPECT_FALSE(point.timestamp.has_value());
  EXPECT_EQ(point.month, 2);
  EXPECT_EQ(point.day, 30);
}

TEST_F(SchemaNormalizerTest, NonNumericDatePart_AlwaysThrows)
{
  auto fields = idaLandfall();
  fields.date = "2021AB29";

  NormalizerOptions options{};
  options.invalidDate = FailurePolicy::MarkMissing;

  SchemaNormalizer normalizer{options};
  EXPECT_THROW(static_cast<void>(normalizer.normalize(makeRecord(fields))),
               hurdat_parse::InvalidDateError);
}

TEST_F(SchemaNormalizerTest, ComposeTimestamp_RejectsOutOfRangeParts)
{
  EXPECT_FALSE(SchemaNormalizer::composeTimestamp(2020, 13, 1, 0, 0).has_value());
  EXPECT_FALSE(SchemaNormalizer::composeTimestamp(2020, 1, 1, 24, 0).has_value());
  EXPECT_FALSE(SchemaNormalizer::composeTimestamp(2019, 2, 29, 0, 0).has_value());
  EXPECT_TRUE(SchemaNormalizer::composeTimestamp(2020, 2, 29, 0, 0).has_value());
}

TEST_F(SchemaNormalizerTest, NormalizeAll_PreservesOrder)
{
  auto first = idaLandfall();
  auto second = idaLandfall();
  second.time = "1800";

  std::vector<hurdat_parse::CompositeRecord> records{makeRecord(first),
                                                     makeRecord(second)};
  SchemaNormalizer normalizer{};
  auto const points = normalizer.normalizeAll(records);

  ASSERT_EQ(points.size(), 2u);
  EXPECT_EQ(points[0].hour, 16);
  EXPECT_EQ(points[1].hour, 18);
}

}  // namespace hurdat_schema::test
