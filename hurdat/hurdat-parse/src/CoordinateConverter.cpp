// Ticket: 0001_best_track_parser

#include "hurdat-parse/src/CoordinateConverter.hpp"

#include <optional>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "hurdat-parse/src/FixedWidthField.hpp"
#include "hurdat-parse/src/ParseErrors.hpp"

namespace hurdat_parse
{

namespace
{

double hemisphereSign(char hemisphere, CoordinateAxis axis)
{
  if (axis == CoordinateAxis::Latitude)
  {
    if (hemisphere == 'N')
    {
      return 1.0;
    }
    if (hemisphere == 'S')
    {
      return -1.0;
    }
  }
  else
  {
    if (hemisphere == 'E')
    {
      return 1.0;
    }
    if (hemisphere == 'W')
    {
      return -1.0;
    }
  }

  throw InvalidHemisphereError{
    fmt::format("invalid {} hemisphere '{}'",
                axis == CoordinateAxis::Latitude ? "latitude" : "longitude",
                hemisphere),
    0};
}

std::optional<double> parseMagnitude(std::string_view text)
{
  text = trim(text);
  if (text.find('.') != std::string_view::npos)
  {
    return parseDecimal(text);
  }
  if (!isAllDigits(text))
  {
    return std::nullopt;
  }
  // Implied tenths of a degree
  auto const tenths = parseInteger(text);
  if (!tenths)
  {
    return std::nullopt;
  }
  return static_cast<double>(*tenths) / 10.0;
}

}  // namespace

double toSignedDegrees(std::string_view magnitude,
                       char hemisphere,
                       CoordinateAxis axis)
{
  double const sign = hemisphereSign(hemisphere, axis);

  auto const value = parseMagnitude(magnitude);
  if (!value || *value < 0.0)
  {
    throw MalformedDataLineError{
      fmt::format("unparseable coordinate magnitude '{}'", trim(magnitude)), 0};
  }

  return sign * *value;
}

}  // namespace hurdat_parse
