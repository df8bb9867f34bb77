// Ticket: 0001_best_track_parser

#include "hurdat-parse/src/ParseErrors.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>

namespace hurdat_parse
{

ParseError::ParseError(const std::string& detail,
                       std::size_t lineNumber,
                       std::optional<StormIdentity> storm)
  : std::runtime_error{compose(detail, lineNumber, storm)},
    detail_{detail},
    lineNumber_{lineNumber},
    storm_{std::move(storm)}
{
}

std::string ParseError::compose(const std::string& detail,
                                std::size_t lineNumber,
                                const std::optional<StormIdentity>& storm)
{
  std::string message;
  if (lineNumber > 0)
  {
    message += fmt::format("line {}: ", lineNumber);
  }
  if (storm)
  {
    message += fmt::format("[{}] ", storm->toString());
  }
  message += detail;
  return message;
}

}  // namespace hurdat_parse
