// Ticket: 0005_columnar_dataset

#include "hurdat-schema/src/TrackDataset.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace hurdat_schema
{

namespace
{

constexpr std::array<const char*, 3> kRadiiThresholds{"34", "50", "64"};
constexpr std::array<const char*, 4> kQuadrants{"ne", "se", "sw", "nw"};

std::vector<ColumnSpec> makeSchema()
{
  std::vector<ColumnSpec> schema{
    {"unique_id", ColumnType::Text, false},
    {"basin", ColumnType::Text, false},
    {"cyclone_number", ColumnType::Text, false},
    {"storm_year", ColumnType::Integer, false},
    {"name", ColumnType::Text, false},
    {"year", ColumnType::Integer, false},
    {"month", ColumnType::Integer, false},
    {"day", ColumnType::Integer, false},
    {"hour", ColumnType::Integer, false},
    {"minute", ColumnType::Integer, false},
    {"timestamp", ColumnType::Timestamp, true},
    {"record_identifier", ColumnType::Text, true},
    {"status", ColumnType::Text, true},
    {"latitude", ColumnType::Real, false},
    {"longitude", ColumnType::Real, false},
    {"max_wind", ColumnType::Integer, true},
    {"min_pressure", ColumnType::Integer, true},
  };

  for (const auto* threshold : kRadiiThresholds)
  {
    for (const auto* quadrant : kQuadrants)
    {
      schema.push_back({std::string{"wind_radii_"} + threshold + "_" + quadrant,
                        ColumnType::Integer,
                        true});
    }
  }

  schema.push_back({"radius_max_wind", ColumnType::Integer, true});
  return schema;
}

CellValue integerCell(const std::optional<int>& value)
{
  if (!value)
  {
    return std::monostate{};
  }
  return static_cast<std::int64_t>(*value);
}

}  // namespace

const std::vector<ColumnSpec>& trackPointSchema()
{
  static const std::vector<ColumnSpec> schema = makeSchema();
  return schema;
}

std::vector<CellValue> toRow(const TrackPoint& point)
{
  std::vector<CellValue> row;
  row.reserve(trackPointSchema().size());

  row.emplace_back(point.uniqueId);
  row.emplace_back(point.basin);
  row.emplace_back(point.cycloneNumber);
  row.emplace_back(static_cast<std::int64_t>(point.stormYear));
  row.emplace_back(point.name);
  row.emplace_back(static_cast<std::int64_t>(point.year));
  row.emplace_back(static_cast<std::int64_t>(point.month));
  row.emplace_back(static_cast<std::int64_t>(point.day));
  row.emplace_back(static_cast<std::int64_t>(point.hour));
  row.emplace_back(static_cast<std::int64_t>(point.minute));

  if (point.timestamp)
  {
    row.emplace_back(static_cast<std::int64_t>(
      point.timestamp->time_since_epoch().count()));
  }
  else
  {
    row.emplace_back(std::monostate{});
  }

  if (point.recordIdentifier)
  {
    row.emplace_back(std::string(1, *point.recordIdentifier));
  }
  else
  {
    row.emplace_back(std::monostate{});
  }

  if (point.status)
  {
    row.emplace_back(std::string{toCode(*point.status)});
  }
  else
  {
    row.emplace_back(std::monostate{});
  }

  row.emplace_back(point.latitude);
  row.emplace_back(point.longitude);
  row.push_back(integerCell(point.maxWind));
  row.push_back(integerCell(point.minPressure));
  for (const auto& radius : point.windRadii)
  {
    row.push_back(integerCell(radius));
  }
  row.push_back(integerCell(point.radiusMaxWind));

  return row;
}

ColumnarTable buildTrackTable(std::span<const TrackPoint> points)
{
  ColumnarTable table{trackPointSchema()};
  for (const auto& point : points)
  {
    table.appendRow(toRow(point));
  }
  return table;
}

}  // namespace hurdat_schema
