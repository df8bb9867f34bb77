// Ticket: 0002_record_assembler

#include "hurdat-parse/src/LineCursor.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace hurdat_parse
{

namespace
{

// getline failure is end of input unless the stream reports a read error
std::optional<std::string> readStreamLine(std::istream& stream,
                                          std::size_t lineNumber)
{
  std::string line;
  if (std::getline(stream, line))
  {
    return line;
  }
  if (stream.bad())
  {
    throw std::runtime_error(fmt::format(
      "Read error on best-track input at line {}", lineNumber + 1));
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> LineCursor::next()
{
  auto line = readLine();
  if (!line)
  {
    return std::nullopt;
  }

  ++lineNumber_;

  // Files distributed with DOS line endings
  if (!line->empty() && line->back() == '\r')
  {
    line->pop_back();
  }
  return line;
}

StreamLineCursor::StreamLineCursor(std::istream& stream)
  : stream_{stream}
{
}

std::optional<std::string> StreamLineCursor::readLine()
{
  return readStreamLine(stream_, lineNumber());
}

FileLineCursor::FileLineCursor(const std::string& path)
  : file_{path}
{
  if (!file_.is_open())
  {
    throw std::runtime_error("Failed to open best-track file: " + path);
  }
}

std::optional<std::string> FileLineCursor::readLine()
{
  return readStreamLine(file_, lineNumber());
}

MemoryLineCursor::MemoryLineCursor(std::vector<std::string> lines)
  : lines_{std::move(lines)}
{
}

std::optional<std::string> MemoryLineCursor::readLine()
{
  if (position_ >= lines_.size())
  {
    return std::nullopt;
  }
  return lines_[position_++];
}

}  // namespace hurdat_parse
