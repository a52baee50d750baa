#include <gtest/gtest.h>

#include "docgraph/basic/source_manager.hpp"

using namespace docgraph;

TEST(SourceRegistry, LineAndColumnFromOffset)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("A.java", "class A {\n  int x;\n}\n");

  const LineColumn lc = sources.get_line_column(SourceLocation(id, 12));
  EXPECT_EQ(lc.line, 2u);
  EXPECT_EQ(lc.column, 3u);
  EXPECT_EQ(sources.get_slice(SourceRange(id, 12, 15)), "int");
}

TEST(SourceRegistry, SecondRegistrationKeepsFirstContent)
{
  SourceRegistry sources;
  const FileId first = sources.register_file("src/A.java", "class A { }");
  const std::string_view before = sources.get_file(first)->content();

  const FileId second = sources.register_file("src/A.java", "class B { void f() { } }");

  EXPECT_EQ(second, first);
  EXPECT_EQ(sources.size(), 1u);
  const SourceFile * file = sources.get_file(first);
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->content(), "class A { }");
  // Views handed out before the second call still point at live text.
  EXPECT_EQ(file->content().data(), before.data());
}

TEST(SourceRegistry, FindByName)
{
  SourceRegistry sources;
  (void)sources.register_file("a.java", "class A { }");
  const FileId b = sources.register_file("b.java", "class B { }");

  ASSERT_TRUE(sources.find("b.java").has_value());
  EXPECT_EQ(*sources.find("b.java"), b);
  EXPECT_FALSE(sources.find("c.java").has_value());
  EXPECT_EQ(sources.get_file(FileId{}), nullptr);
}
