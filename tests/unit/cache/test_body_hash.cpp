#include <gtest/gtest.h>

#include "docgraph/cache/body_hash.hpp"

using namespace docgraph;

TEST(CacheHash, NormalizeStripsAllWhitespace)
{
  EXPECT_EQ(normalize_body("{ return a +\n\tb; }"), "{returna+b;}");
  EXPECT_EQ(normalize_body(""), "");
}

TEST(CacheHash, KnownDigest)
{
  // sha256("")
  EXPECT_EQ(
    compute_hash(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  // sha256("abc"), with whitespace removed first
  EXPECT_EQ(
    compute_hash(" a b\nc "), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CacheHash, WhitespaceInsensitiveButContentSensitive)
{
  EXPECT_EQ(compute_hash("{ return 1; }"), compute_hash("{\n  return 1;\n}"));
  EXPECT_NE(compute_hash("{ return 1; }"), compute_hash("{ return 2; }"));
  EXPECT_EQ(compute_hash("x").size(), 64u);
}
