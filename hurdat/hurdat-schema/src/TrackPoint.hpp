// Ticket: 0004_schema_normalizer

#ifndef HURDAT_SCHEMA_TRACK_POINT_HPP
#define HURDAT_SCHEMA_TRACK_POINT_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "hurdat-schema/src/StormStatus.hpp"

namespace hurdat_schema
{

/**
 * @brief Fully typed observation, one row of the output dataset
 *
 * Optional members are the nullable columns: a missing measurement is an
 * empty optional, never a dropped row and never a sentinel number.
 */
struct TrackPoint
{
  // Storm identity (from the header)
  std::string uniqueId;  // storm year + basin + cyclone number, "1851AL01"
  std::string basin;
  std::string cycloneNumber;
  int stormYear{0};
  std::string name;

  // Observation time
  int year{0};
  int month{0};
  int day{0};
  int hour{0};
  int minute{0};
  std::optional<std::chrono::sys_seconds> timestamp;  // UTC

  std::optional<char> recordIdentifier;  // 'L' landfall, 'W', 'P', ...
  std::optional<StormStatus> status;

  double latitude{0.0};   // [deg], north positive
  double longitude{0.0};  // [deg], east positive

  std::optional<int> maxWind;      // [kt]
  std::optional<int> minPressure;  // [mb]
  // 34/50/64 kt radii, NE/SE/SW/NW within each threshold [nm]
  std::array<std::optional<int>, 12> windRadii;
  std::optional<int> radiusMaxWind;  // [nm]

  bool operator==(const TrackPoint&) const = default;
};

}  // namespace hurdat_schema

#endif  // HURDAT_SCHEMA_TRACK_POINT_HPP
