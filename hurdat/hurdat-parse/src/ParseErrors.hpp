// Ticket: 0001_best_track_parser

#ifndef HURDAT_PARSE_PARSE_ERRORS_HPP
#define HURDAT_PARSE_PARSE_ERRORS_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "hurdat-parse/src/StormIdentity.hpp"

namespace hurdat_parse
{

/**
 * @brief Base class for every structural failure raised while reading a
 * best-track file
 *
 * Carries the 1-based source line number (0 when the failing value did not
 * come from a line, e.g. a direct call to a converter) and the identity of the
 * storm being read when one is known. what() embeds both; detail() returns the
 * bare description so callers can re-raise with more context.
 */
class ParseError : public std::runtime_error
{
public:
  ParseError(const std::string& detail,
             std::size_t lineNumber,
             std::optional<StormIdentity> storm = std::nullopt);

  [[nodiscard]] std::size_t lineNumber() const noexcept
  {
    return lineNumber_;
  }

  [[nodiscard]] const std::optional<StormIdentity>& storm() const noexcept
  {
    return storm_;
  }

  [[nodiscard]] const std::string& detail() const noexcept
  {
    return detail_;
  }

private:
  static std::string compose(const std::string& detail,
                             std::size_t lineNumber,
                             const std::optional<StormIdentity>& storm);

  std::string detail_;
  std::size_t lineNumber_;
  std::optional<StormIdentity> storm_;
};

// Header line too short, or a header field fails its shape check
class MalformedHeaderError : public ParseError
{
public:
  using ParseError::ParseError;
};

// Data line too short, or an unparseable value in a required position
class MalformedDataLineError : public ParseError
{
public:
  using ParseError::ParseError;
};

// End of input reached before a header's declared entries were read
class TruncatedStormError : public ParseError
{
public:
  using ParseError::ParseError;
};

// Hemisphere character is not N/S (latitude) or E/W (longitude)
class InvalidHemisphereError : public ParseError
{
public:
  using ParseError::ParseError;
};

// Status code outside {TD, TS, HU, EX, SD, SS, LO, WV, DB}
class UnknownStatusError : public ParseError
{
public:
  using ParseError::ParseError;
};

// Date/time parts do not form a real calendar instant
class InvalidDateError : public ParseError
{
public:
  using ParseError::ParseError;
};

// Raised only when the caller opts in to failing on unexpected count mismatches
class CountMismatchError : public ParseError
{
public:
  using ParseError::ParseError;
};

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_PARSE_ERRORS_HPP
