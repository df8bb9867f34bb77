// Ticket: 0001_best_track_parser

#include "hurdat-parse/src/DataLineParser.hpp"

#include <spdlog/fmt/fmt.h>

#include "hurdat-parse/src/ParseErrors.hpp"

namespace hurdat_parse
{

namespace
{

char hemisphereAt(std::string_view line, FieldSpan span)
{
  return line[span.begin];
}

}  // namespace

RawTrackPoint parseDataLine(std::string_view line,
                            std::size_t lineNumber,
                            bool requireRadiusMaxWind)
{
  using namespace data_layout;

  std::size_t const required =
    requireRadiusMaxWind ? kMinLength : kMinLengthWithoutRadiusMaxWind;
  if (line.size() < required)
  {
    throw MalformedDataLineError{
      fmt::format("data line has {} characters, at least {} required",
                  line.size(),
                  required),
      lineNumber};
  }

  RawTrackPoint point{};
  point.year = std::string{extractField(line, kYear)};
  point.month = std::string{extractField(line, kMonth)};
  point.day = std::string{extractField(line, kDay)};
  point.hour = std::string{extractField(line, kHour)};
  point.minute = std::string{extractField(line, kMinute)};
  point.recordIdentifier = std::string{extractField(line, kRecordIdentifier)};
  point.status = std::string{extractField(line, kStatus)};
  point.latitudeMagnitude = std::string{extractField(line, kLatitudeMagnitude)};
  point.latitudeHemisphere = hemisphereAt(line, kLatitudeHemisphere);
  point.longitudeMagnitude =
    std::string{extractField(line, kLongitudeMagnitude)};
  point.longitudeHemisphere = hemisphereAt(line, kLongitudeHemisphere);
  point.maxWind = std::string{extractField(line, kMaxWind)};
  point.minPressure = std::string{extractField(line, kMinPressure)};

  for (std::size_t i = 0; i < kWindRadiiCount; ++i)
  {
    point.windRadii[i] = std::string{extractField(line, kWindRadii[i])};
  }

  // Empty when the line predates the radius of maximum wind column
  point.radiusMaxWind = std::string{extractField(line, kRadiusMaxWind)};

  return point;
}

}  // namespace hurdat_parse
