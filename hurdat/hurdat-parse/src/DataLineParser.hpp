// Ticket: 0001_best_track_parser

#ifndef HURDAT_PARSE_DATA_LINE_PARSER_HPP
#define HURDAT_PARSE_DATA_LINE_PARSER_HPP

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include "hurdat-parse/src/FixedWidthField.hpp"

namespace hurdat_parse
{

/**
 * @brief Every field of a data line as trimmed text, before type coercion
 *
 * Missing measurements keep whatever the file holds ("-999", "-99" or blank).
 * Turning those into typed values or missing markers is left to the schema
 * normalizer.
 */
struct RawTrackPoint
{
  std::string year;
  std::string month;
  std::string day;
  std::string hour;
  std::string minute;
  std::string recordIdentifier;  // Single character or empty
  std::string status;            // Two-letter status code
  std::string latitudeMagnitude;
  char latitudeHemisphere{' '};
  std::string longitudeMagnitude;
  char longitudeHemisphere{' '};
  std::string maxWind;      // [kt]
  std::string minPressure;  // [mb]
  // 34/50/64 kt radii, NE/SE/SW/NW within each threshold [nm]
  std::array<std::string, data_layout::kWindRadiiCount> windRadii;
  std::string radiusMaxWind;  // [nm]

  bool operator==(const RawTrackPoint&) const = default;
};

/**
 * @brief Split a fixed-width data line into its raw fields
 *
 * @param line Raw line without its terminator
 * @param lineNumber 1-based source line, reported in errors (0 if unknown)
 * @param requireRadiusMaxWind When false, lines that stop after the last wind
 *        radius are accepted and radiusMaxWind is left empty
 * @throws MalformedDataLineError if the line is shorter than required
 */
[[nodiscard]] RawTrackPoint parseDataLine(std::string_view line,
                                          std::size_t lineNumber = 0,
                                          bool requireRadiusMaxWind = true);

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_DATA_LINE_PARSER_HPP
