#include <gtest/gtest.h>

#include "docgraph/model/entity.hpp"

using docgraph::count_call_arguments;
using docgraph::k_unknown_argument_count;

TEST(ModelCallArguments, EmptyList)
{
  EXPECT_EQ(count_call_arguments("foo()"), 0);
  EXPECT_EQ(count_call_arguments("foo(   )"), 0);
}

TEST(ModelCallArguments, TopLevelCommasOnly)
{
  EXPECT_EQ(count_call_arguments("foo(1, 2)"), 2);
  EXPECT_EQ(count_call_arguments("foo(a, g(b, c))"), 2);
  EXPECT_EQ(count_call_arguments("foo(new int[]{1, 2, 3})"), 1);
  EXPECT_EQ(count_call_arguments("foo(x -> { a(1, 2); })"), 1);
}

TEST(ModelCallArguments, StringAndCharLiteralsAreOpaque)
{
  EXPECT_EQ(count_call_arguments(R"x(foo("a, b", ','))x"), 2);
  EXPECT_EQ(count_call_arguments(R"x(foo("quote \", comma", 1))x"), 2);
  EXPECT_EQ(count_call_arguments(R"x(foo("(", ")"))x"), 2);
}

TEST(ModelCallArguments, GenericTypeArgumentsAreNotSeparators)
{
  EXPECT_EQ(count_call_arguments("foo(new HashMap<String, Integer>(), 1)"), 2);
  EXPECT_EQ(count_call_arguments("foo(a < b, c > d)"), 2);
}

TEST(ModelCallArguments, NoArgumentListIsUnknown)
{
  EXPECT_EQ(count_call_arguments("foo"), k_unknown_argument_count);
}

TEST(ModelCallArguments, ArityMatchingForVariadicMethods)
{
  docgraph::Method m;
  m.parameters = {"String fmt", "Object... args"};
  m.is_variadic = true;

  EXPECT_TRUE(m.accepts_argument_count(1));
  EXPECT_TRUE(m.accepts_argument_count(4));
  EXPECT_FALSE(m.accepts_argument_count(0));
  EXPECT_FALSE(m.accepts_argument_count(k_unknown_argument_count));

  m.is_variadic = false;
  EXPECT_TRUE(m.accepts_argument_count(2));
  EXPECT_FALSE(m.accepts_argument_count(3));
}
