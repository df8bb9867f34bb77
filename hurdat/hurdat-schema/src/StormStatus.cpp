// Ticket: 0004_schema_normalizer

#include "hurdat-schema/src/StormStatus.hpp"

namespace hurdat_schema
{

std::string_view toCode(StormStatus status)
{
  switch (status)
  {
    case StormStatus::TD:
      return "TD";
    case StormStatus::TS:
      return "TS";
    case StormStatus::HU:
      return "HU";
    case StormStatus::EX:
      return "EX";
    case StormStatus::SD:
      return "SD";
    case StormStatus::SS:
      return "SS";
    case StormStatus::LO:
      return "LO";
    case StormStatus::WV:
      return "WV";
    case StormStatus::DB:
      return "DB";
  }
  return "";
}

std::optional<StormStatus> parseStormStatus(std::string_view code)
{
  for (auto const status : kAllStormStatuses)
  {
    if (toCode(status) == code)
    {
      return status;
    }
  }
  return std::nullopt;
}

}  // namespace hurdat_schema
