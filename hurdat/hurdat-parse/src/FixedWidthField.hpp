// Ticket: 0001_best_track_parser

#ifndef HURDAT_PARSE_FIXED_WIDTH_FIELD_HPP
#define HURDAT_PARSE_FIXED_WIDTH_FIELD_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace hurdat_parse
{

/**
 * @brief Half-open character range [begin, end) of one fixed-width field
 */
struct FieldSpan
{
  std::size_t begin;
  std::size_t end;

  [[nodiscard]] constexpr std::size_t width() const
  {
    return end - begin;
  }
};

/**
 * @brief Column table for header lines
 *
 * Example: "AL011851,            UNNAMED,     14,"
 */
namespace header_layout
{
inline constexpr FieldSpan kBasin{0, 2};
inline constexpr FieldSpan kCycloneNumber{2, 4};
inline constexpr FieldSpan kYear{4, 8};
inline constexpr FieldSpan kName{18, 28};
inline constexpr FieldSpan kEntryCount{33, 36};

inline constexpr std::size_t kMinLength = kEntryCount.end;
}  // namespace header_layout

/**
 * @brief Column table for data (track point) lines
 *
 * Example:
 * "18510625, 0000,  , HU, 28.0N,  94.8W,  80, -999, -999, ..., -999, -999,"
 *
 * The twelve wind radii are ordered 34 kt NE/SE/SW/NW, then 50 kt, then
 * 64 kt, each 4 characters wide on a 6 character stride starting at 49.
 */
namespace data_layout
{
inline constexpr FieldSpan kYear{0, 4};
inline constexpr FieldSpan kMonth{4, 6};
inline constexpr FieldSpan kDay{6, 8};
inline constexpr FieldSpan kHour{10, 12};
inline constexpr FieldSpan kMinute{12, 14};
inline constexpr FieldSpan kRecordIdentifier{16, 17};
inline constexpr FieldSpan kStatus{19, 21};
inline constexpr FieldSpan kLatitudeMagnitude{23, 27};
inline constexpr FieldSpan kLatitudeHemisphere{27, 28};
inline constexpr FieldSpan kLongitudeMagnitude{30, 35};
inline constexpr FieldSpan kLongitudeHemisphere{35, 36};
inline constexpr FieldSpan kMaxWind{38, 41};
inline constexpr FieldSpan kMinPressure{43, 47};

inline constexpr std::size_t kWindRadiiCount = 12;
inline constexpr std::size_t kWindRadiiStart = 49;
inline constexpr std::size_t kWindRadiiWidth = 4;
inline constexpr std::size_t kWindRadiiStride = 6;

inline constexpr std::array<FieldSpan, kWindRadiiCount> kWindRadii = []
{
  std::array<FieldSpan, kWindRadiiCount> spans{};
  for (std::size_t i = 0; i < kWindRadiiCount; ++i)
  {
    std::size_t const begin = kWindRadiiStart + i * kWindRadiiStride;
    spans[i] = FieldSpan{begin, begin + kWindRadiiWidth};
  }
  return spans;
}();

inline constexpr FieldSpan kRadiusMaxWind{121, 125};

// Full line, radius of maximum wind included
inline constexpr std::size_t kMinLength = kRadiusMaxWind.end;
// Revisions published before the radius of maximum wind column existed
inline constexpr std::size_t kMinLengthWithoutRadiusMaxWind =
  kWindRadii.back().end;

static_assert(kWindRadii.back().end == 119);
}  // namespace data_layout

/**
 * @brief Strip leading and trailing blanks (space, tab, CR, LF)
 */
[[nodiscard]] std::string_view trim(std::string_view text);

/**
 * @brief Extract a field and trim it
 *
 * Characters past the end of the line are treated as absent, so a short line
 * yields a shortened (possibly empty) field. Callers check line length before
 * extracting required fields.
 */
[[nodiscard]] std::string_view extractField(std::string_view line,
                                            FieldSpan span);

/**
 * @brief Parse a whole string as a base-10 integer
 *
 * Accepts an optional leading '-' or '+'. Returns nullopt when the text is
 * empty, has trailing characters, or overflows int.
 */
[[nodiscard]] std::optional<int> parseInteger(std::string_view text);

/**
 * @brief Parse a whole string as a decimal number ("28.0", "-3.5", "94")
 */
[[nodiscard]] std::optional<double> parseDecimal(std::string_view text);

/**
 * @brief True when every character of the text is an ASCII digit
 */
[[nodiscard]] bool isAllDigits(std::string_view text);

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_FIXED_WIDTH_FIELD_HPP
