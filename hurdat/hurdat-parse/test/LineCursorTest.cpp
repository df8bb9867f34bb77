// Ticket: 0002_record_assembler

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

#include "hurdat-parse/src/LineCursor.hpp"

using namespace hurdat_parse;

TEST(LineCursorTest, StreamCursor_NumbersLinesFromOne)
{
  std::istringstream input{"first\nsecond\n"};
  StreamLineCursor cursor{input};

  EXPECT_EQ(cursor.lineNumber(), 0u);
  EXPECT_EQ(cursor.next(), "first");
  EXPECT_EQ(cursor.lineNumber(), 1u);
  EXPECT_EQ(cursor.next(), "second");
  EXPECT_EQ(cursor.lineNumber(), 2u);
  EXPECT_FALSE(cursor.next().has_value());
  EXPECT_EQ(cursor.lineNumber(), 2u);
}

TEST(LineCursorTest, StreamCursor_ReadErrorThrowsWithLineNumber)
{
  std::istringstream input{"first\nsecond\nthird\n"};
  StreamLineCursor cursor{input};

  EXPECT_EQ(cursor.next(), "first");
  input.setstate(std::ios::badbit);

  try
  {
    static_cast<void>(cursor.next());
    FAIL() << "Expected std::runtime_error";
  }
  catch (const std::runtime_error& e)
  {
    EXPECT_NE(std::string{e.what()}.find("line 2"), std::string::npos);
  }
  EXPECT_EQ(cursor.lineNumber(), 1u);
}

TEST(LineCursorTest, StripsCarriageReturn)
{
  std::istringstream input{"AL011851\r\nnext\r\n"};
  StreamLineCursor cursor{input};

  EXPECT_EQ(cursor.next(), "AL011851");
  EXPECT_EQ(cursor.next(), "next");
}

TEST(LineCursorTest, MemoryCursor_YieldsLinesInOrder)
{
  MemoryLineCursor cursor{{"a", "", "c"}};

  EXPECT_EQ(cursor.next(), "a");
  EXPECT_EQ(cursor.next(), "");
  EXPECT_EQ(cursor.next(), "c");
  EXPECT_FALSE(cursor.next().has_value());
}

TEST(LineCursorTest, FileCursor_MissingFile_Throws)
{
  EXPECT_THROW(FileLineCursor{"/nonexistent/path/hurdat2.txt"},
               std::runtime_error);
}
