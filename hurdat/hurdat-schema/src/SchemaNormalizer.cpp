// Ticket: 0004_schema_normalizer

#include "hurdat-schema/src/SchemaNormalizer.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "hurdat-parse/src/FixedWidthField.hpp"
#include "hurdat-parse/src/ParseErrors.hpp"

namespace hurdat_schema
{

namespace
{

int requireDatePart(std::string_view text,
                    std::string_view label,
                    const hurdat_parse::CompositeRecord& record)
{
  auto const value = hurdat_parse::parseInteger(text);
  if (!value || *value < 0)
  {
    throw hurdat_parse::InvalidDateError{
      fmt::format("{} '{}' is not a non-negative integer", label, text),
      record.lineNumber,
      record.header.identity()};
  }
  return *value;
}

}  // namespace

SchemaNormalizer::SchemaNormalizer(NormalizerOptions options)
  : options_{std::move(options)}
{
}

TrackPoint SchemaNormalizer::normalize(
  const hurdat_parse::CompositeRecord& record) const
{
  const auto& header = record.header;
  const auto& raw = record.point;

  TrackPoint point{};
  point.uniqueId = header.uniqueId();
  point.basin = header.basin;
  point.cycloneNumber = header.cycloneNumber;
  point.stormYear = header.year;
  point.name = header.name;

  point.year = requireDatePart(raw.year, "year", record);
  point.month = requireDatePart(raw.month, "month", record);
  point.day = requireDatePart(raw.day, "day", record);
  point.hour = requireDatePart(raw.hour, "hour", record);
  point.minute = requireDatePart(raw.minute, "minute", record);

  point.timestamp = composeTimestamp(
    point.year, point.month, point.day, point.hour, point.minute);
  if (!point.timestamp)
  {
    auto const detail = fmt::format("{}-{}-{} {:02}:{:02} is not a valid date",
                                    raw.year,
                                    raw.month,
                                    raw.day,
                                    point.hour,
                                    point.minute);
    if (options_.invalidDate == FailurePolicy::Fail)
    {
      throw hurdat_parse::InvalidDateError{
        detail, record.lineNumber, header.identity()};
    }
    spdlog::warn("line {}: {}, timestamp stored as missing",
                 record.lineNumber,
                 detail);
  }

  if (!raw.recordIdentifier.empty())
  {
    point.recordIdentifier = raw.recordIdentifier.front();
  }

  point.status = parseStormStatus(raw.status);
  if (!point.status)
  {
    auto const detail = fmt::format("unknown status code '{}'", raw.status);
    if (options_.unknownStatus == FailurePolicy::Fail)
    {
      throw hurdat_parse::UnknownStatusError{
        detail, record.lineNumber, header.identity()};
    }
    spdlog::warn("line {}: {}, status stored as missing",
                 record.lineNumber,
                 detail);
  }

  point.latitude = record.latitude;
  point.longitude = record.longitude;

  point.maxWind = coerceMeasurement(raw.maxWind);
  point.minPressure = coerceMeasurement(raw.minPressure);
  for (std::size_t i = 0; i < point.windRadii.size(); ++i)
  {
    point.windRadii[i] = coerceMeasurement(raw.windRadii[i]);
  }
  point.radiusMaxWind = coerceMeasurement(raw.radiusMaxWind);

  return point;
}

std::vector<TrackPoint> SchemaNormalizer::normalizeAll(
  std::span<const hurdat_parse::CompositeRecord> records) const
{
  std::vector<TrackPoint> points;
  points.reserve(records.size());
  for (const auto& record : records)
  {
    points.push_back(normalize(record));
  }
  return points;
}

std::optional<int> SchemaNormalizer::coerceMeasurement(
  std::string_view text) const
{
  auto const value = hurdat_parse::parseInteger(text);
  if (!value)
  {
    return std::nullopt;
  }
  if (options_.sentinels == SentinelPolicy::MarkMissing && isSentinel(*value))
  {
    return std::nullopt;
  }
  return value;
}

std::optional<std::chrono::sys_seconds> SchemaNormalizer::composeTimestamp(
  int year,
  int month,
  int day,
  int hour,
  int minute)
{
  using namespace std::chrono;

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 ||
      hour > 23 || minute < 0 || minute > 59)
  {
    return std::nullopt;
  }

  year_month_day const date{std::chrono::year{year},
                            std::chrono::month{static_cast<unsigned>(month)},
                            std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok())
  {
    return std::nullopt;
  }

  return sys_days{date} + hours{hour} + minutes{minute};
}

bool SchemaNormalizer::isSentinel(int value) const
{
  return std::find(options_.sentinelValues.begin(),
                   options_.sentinelValues.end(),
                   value) != options_.sentinelValues.end();
}

}  // namespace hurdat_schema
