// Ticket: 0001_best_track_parser

#include <gtest/gtest.h>

#include "hurdat-parse/src/CoordinateConverter.hpp"
#include "hurdat-parse/src/ParseErrors.hpp"

using namespace hurdat_parse;

TEST(CoordinateConverterTest, NorthAndEastArePositive)
{
  EXPECT_DOUBLE_EQ(toSignedDegrees("28.0", 'N', CoordinateAxis::Latitude), 28.0);
  EXPECT_DOUBLE_EQ(toSignedDegrees("94.8", 'E', CoordinateAxis::Longitude),
                   94.8);
}

TEST(CoordinateConverterTest, SouthAndWestAreNegative)
{
  EXPECT_DOUBLE_EQ(toSignedDegrees("28.0", 'S', CoordinateAxis::Latitude),
                   -28.0);
  EXPECT_DOUBLE_EQ(toSignedDegrees("94.8", 'W', CoordinateAxis::Longitude),
                   -94.8);
}

TEST(CoordinateConverterTest, MagnitudeWithoutPointIsTenthsOfDegree)
{
  EXPECT_DOUBLE_EQ(toSignedDegrees("283", 'N', CoordinateAxis::Latitude), 28.3);
  EXPECT_DOUBLE_EQ(toSignedDegrees(" 948", 'W', CoordinateAxis::Longitude),
                   -94.8);
}

TEST(CoordinateConverterTest, UnknownHemisphere_Throws)
{
  EXPECT_THROW(
    static_cast<void>(toSignedDegrees("28.0", 'X', CoordinateAxis::Latitude)),
    InvalidHemisphereError);
}

TEST(CoordinateConverterTest, HemisphereFromOtherAxis_Throws)
{
  EXPECT_THROW(
    static_cast<void>(toSignedDegrees("28.0", 'E', CoordinateAxis::Latitude)),
    InvalidHemisphereError);
  EXPECT_THROW(
    static_cast<void>(toSignedDegrees("94.8", 'N', CoordinateAxis::Longitude)),
    InvalidHemisphereError);
}

TEST(CoordinateConverterTest, UnparseableMagnitude_Throws)
{
  EXPECT_THROW(
    static_cast<void>(toSignedDegrees("2x.0", 'N', CoordinateAxis::Latitude)),
    MalformedDataLineError);
  EXPECT_THROW(
    static_cast<void>(toSignedDegrees("", 'N', CoordinateAxis::Latitude)),
    MalformedDataLineError);
}
