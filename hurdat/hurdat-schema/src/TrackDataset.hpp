// Ticket: 0005_columnar_dataset

#ifndef HURDAT_SCHEMA_TRACK_DATASET_HPP
#define HURDAT_SCHEMA_TRACK_DATASET_HPP

#include <span>
#include <vector>

#include "hurdat-schema/src/ColumnarTable.hpp"
#include "hurdat-schema/src/TrackPoint.hpp"

namespace hurdat_schema
{

/**
 * @brief Declared output schema, one column per TrackPoint member
 *
 * Column order: unique_id, basin, cyclone_number, storm_year, name, year,
 * month, day, hour, minute, timestamp, record_identifier, status, latitude,
 * longitude, max_wind, min_pressure, wind_radii_{34,50,64}_{ne,se,sw,nw},
 * radius_max_wind.
 */
[[nodiscard]] const std::vector<ColumnSpec>& trackPointSchema();

/**
 * @brief Cells of one TrackPoint in trackPointSchema() order
 */
[[nodiscard]] std::vector<CellValue> toRow(const TrackPoint& point);

/**
 * @brief Build the columnar dataset, preserving point order
 */
[[nodiscard]] ColumnarTable buildTrackTable(std::span<const TrackPoint> points);

}  // namespace hurdat_schema

#endif  // HURDAT_SCHEMA_TRACK_DATASET_HPP
