// Ticket: 0001_best_track_parser

#ifndef HURDAT_PARSE_COORDINATE_CONVERTER_HPP
#define HURDAT_PARSE_COORDINATE_CONVERTER_HPP

#include <string_view>

namespace hurdat_parse
{

enum class CoordinateAxis
{
  Latitude,   // Hemisphere N or S
  Longitude,  // Hemisphere E or W
};

/**
 * @brief Convert a magnitude + hemisphere pair into signed decimal degrees
 *
 * N and E give a positive value, S and W a negative one. The magnitude is
 * either decimal ("28.0") or, as in older revisions of the format, an integer
 * count of tenths of a degree ("283" -> 28.3).
 *
 * @param magnitude Unsigned magnitude text, surrounding blanks ignored
 * @param hemisphere Hemisphere character for the given axis
 * @param axis Selects the accepted hemisphere pair
 * @return Signed degrees
 * @throws InvalidHemisphereError if the hemisphere does not belong to the axis
 * @throws MalformedDataLineError if the magnitude is not a non-negative number
 */
[[nodiscard]] double toSignedDegrees(std::string_view magnitude,
                                     char hemisphere,
                                     CoordinateAxis axis);

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_COORDINATE_CONVERTER_HPP
