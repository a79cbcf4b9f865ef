#include <gtest/gtest.h>

#include <string>

#include "sysml_lite/basic/source_manager.hpp"

using namespace sysml_lite;

TEST(SourceFile, PositionOfOffset)
{
  const SourceFile file("a.sysml", "part A;\n  port p;\n");

  EXPECT_EQ(file.line_count(), 3U);
  EXPECT_EQ(file.position_of(0).line, 1U);
  EXPECT_EQ(file.position_of(0).column, 1U);

  const auto port = file.position_of(10);
  EXPECT_EQ(port.line, 2U);
  EXPECT_EQ(port.column, 3U);

  // End of input after a trailing newline sits on an empty last line.
  const auto end = file.position_of(static_cast<uint32_t>(file.size()));
  EXPECT_EQ(end.line, 3U);
  EXPECT_EQ(end.column, 1U);

  // Offsets past the end clamp to it.
  EXPECT_EQ(file.position_of(1000).line, 3U);
}

TEST(SourceFile, ColumnsCountCharactersLikeTheLexer)
{
  // `é` is two bytes but one column.
  const SourceFile file("a.sysml", "\xC3\xA9 x");
  EXPECT_EQ(file.position_of(3).column, 3U);
}

TEST(SourceFile, LineTextDropsTerminators)
{
  const SourceFile file("a.sysml", "part A;\r\n  port p;\n");
  EXPECT_EQ(file.line_text(1), "part A;");
  EXPECT_EQ(file.line_text(2), "  port p;");
  EXPECT_EQ(file.line_text(3), "");
  EXPECT_EQ(file.line_text(0), "");
  EXPECT_EQ(file.line_text(9), "");
}

TEST(SourceFile, SliceIsClamped)
{
  const FileId id{0};
  const SourceFile file("a.sysml", "part A;");
  EXPECT_EQ(file.slice(SourceRange{id, 0, 4}), "part");
  EXPECT_EQ(file.slice(SourceRange{id, 5, 100}), "A;");
  EXPECT_EQ(file.slice(SourceRange{id, 7, 7}), "");
  EXPECT_EQ(file.slice(SourceRange{}), "");
}

TEST(SourceRange, CoverSpansBothRanges)
{
  const FileId id{0};
  const SourceRange kw{id, 0, 4};
  const SourceRange semi{id, 9, 10};

  const SourceRange whole = SourceRange::cover(kw, semi);
  EXPECT_EQ(whole.start, 0U);
  EXPECT_EQ(whole.end, 10U);
  EXPECT_EQ(whole.size(), 10U);

  EXPECT_EQ(SourceRange::empty_at(id, 7).size(), 0U);
  EXPECT_TRUE(SourceRange::empty_at(id, 7).is_valid());
  EXPECT_FALSE(SourceRange{}.is_valid());
}

TEST(SourceRegistry, EveryAddGetsItsOwnId)
{
  SourceRegistry reg;
  const FileId a = reg.add("model/a.sysml", "part A;");
  const FileId b = reg.add("model/b.sysml", "part B;");
  const FileId again = reg.add("model/a.sysml", "part C;");

  ASSERT_TRUE(a.is_valid());
  EXPECT_NE(a, b);
  EXPECT_NE(a, again);
  EXPECT_EQ(reg.size(), 3U);
  EXPECT_EQ(reg.file(a)->text(), "part A;");
  EXPECT_EQ(reg.file(again)->text(), "part C;");
  EXPECT_EQ(reg.file(b)->path().string(), "model/b.sysml");

  EXPECT_EQ(reg.slice(SourceRange{b, 5, 6}), "B");
  const auto pos = reg.position_of(SourceRange{b, 5, 6});
  EXPECT_EQ(pos.line, 1U);
  EXPECT_EQ(pos.column, 6U);
}

TEST(SourceRegistry, UnknownIdsResolveToNothing)
{
  SourceRegistry reg;
  EXPECT_EQ(reg.file(FileId::invalid()), nullptr);
  EXPECT_EQ(reg.file(FileId{5}), nullptr);
  EXPECT_FALSE(reg.position_of(SourceRange{FileId{0}, 0, 1}).is_valid());
  EXPECT_EQ(reg.slice(SourceRange{FileId{0}, 0, 1}), "");
}
