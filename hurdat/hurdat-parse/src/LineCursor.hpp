// Ticket: 0002_record_assembler

#ifndef HURDAT_PARSE_LINE_CURSOR_HPP
#define HURDAT_PARSE_LINE_CURSOR_HPP

#include <cstddef>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace hurdat_parse
{

/**
 * @brief Forward-only cursor over the lines of a best-track source
 *
 * The format is stateful (a header's count decides how many following lines
 * belong to it), so lines are handed out strictly in order and never revisited.
 * A cursor is owned by exactly one RecordAssembler.
 *
 * Subclasses supply raw lines through readLine(); next() strips a trailing
 * carriage return and keeps the line counter.
 */
class LineCursor
{
public:
  virtual ~LineCursor() = default;

  LineCursor() = default;
  LineCursor(const LineCursor&) = delete;
  LineCursor& operator=(const LineCursor&) = delete;
  LineCursor(LineCursor&&) = delete;
  LineCursor& operator=(LineCursor&&) = delete;

  /**
   * @brief Advance to the next line
   * @return The line without terminator, or nullopt at end of input
   * @throws std::runtime_error if the underlying stream fails mid-read
   */
  std::optional<std::string> next();

  /**
   * @brief 1-based number of the line most recently returned by next()
   *
   * 0 before the first call.
   */
  [[nodiscard]] std::size_t lineNumber() const
  {
    return lineNumber_;
  }

protected:
  virtual std::optional<std::string> readLine() = 0;

private:
  std::size_t lineNumber_{0};
};

/**
 * @brief Cursor over a caller-owned input stream
 *
 * The stream must outlive the cursor.
 */
class StreamLineCursor : public LineCursor
{
public:
  explicit StreamLineCursor(std::istream& stream);

protected:
  std::optional<std::string> readLine() override;

private:
  std::istream& stream_;
};

/**
 * @brief Cursor that opens and owns a file
 */
class FileLineCursor : public LineCursor
{
public:
  /**
   * @throws std::runtime_error if the file cannot be opened
   */
  explicit FileLineCursor(const std::string& path);

protected:
  std::optional<std::string> readLine() override;

private:
  std::ifstream file_;
};

/**
 * @brief Cursor over lines already held in memory
 */
class MemoryLineCursor : public LineCursor
{
public:
  explicit MemoryLineCursor(std::vector<std::string> lines);

protected:
  std::optional<std::string> readLine() override;

private:
  std::vector<std::string> lines_;
  std::size_t position_{0};
};

}  // namespace hurdat_parse

#endif  // HURDAT_PARSE_LINE_CURSOR_HPP
