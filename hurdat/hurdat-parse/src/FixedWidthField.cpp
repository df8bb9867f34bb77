// Ticket: 0001_best_track_parser

#include "hurdat-parse/src/FixedWidthField.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace hurdat_parse
{

namespace
{

constexpr std::string_view kBlank = " \t\r\n";

// from_chars rejects an explicit '+', which the format never needs but a
// hand-edited file might contain
std::string_view stripPlus(std::string_view text)
{
  if (!text.empty() && text.front() == '+')
  {
    text.remove_prefix(1);
  }
  return text;
}

}  // namespace

std::string_view trim(std::string_view text)
{
  auto const first = text.find_first_not_of(kBlank);
  if (first == std::string_view::npos)
  {
    return {};
  }
  auto const last = text.find_last_not_of(kBlank);
  return text.substr(first, last - first + 1);
}

std::string_view extractField(std::string_view line, FieldSpan span)
{
  if (span.begin >= line.size())
  {
    return {};
  }
  auto const width = std::min(span.width(), line.size() - span.begin);
  return trim(line.substr(span.begin, width));
}

std::optional<int> parseInteger(std::string_view text)
{
  text = stripPlus(trim(text));
  if (text.empty())
  {
    return std::nullopt;
  }

  int value{0};
  auto const* const last = text.data() + text.size();
  auto const [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} || ptr != last)
  {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parseDecimal(std::string_view text)
{
  text = stripPlus(trim(text));
  if (text.empty())
  {
    return std::nullopt;
  }

  double value{0.0};
  auto const* const last = text.data() + text.size();
  auto const [ptr, ec] =
    std::from_chars(text.data(), last, value, std::chars_format::fixed);
  if (ec != std::errc{} || ptr != last)
  {
    return std::nullopt;
  }
  return value;
}

bool isAllDigits(std::string_view text)
{
  return !text.empty() &&
         std::all_of(text.begin(),
                     text.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace hurdat_parse
