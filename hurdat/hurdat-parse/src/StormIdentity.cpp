// Ticket: 0001_best_track_parser

#include "hurdat-parse/src/StormIdentity.hpp"

#include <spdlog/fmt/fmt.h>

namespace hurdat_parse
{

std::string StormIdentity::toString() const
{
  return fmt::format("{}{} {} {}", basin, cycloneNumber, year, name);
}

}  // namespace hurdat_parse
