// PropertyTokenizerTests.cpp - tests for splitting property paths into segments

#include <catch2/catch_test_macros.hpp>

#include <Trellis/PropertyTokenizer.hpp>

#include <string>

TEST_CASE("SimpleNameHasNoIndexOrChildren", "[trellis][PropertyTokenizer]")
{
  Trellis::PropertyTokenizer prop{"name"};
  CHECK(prop.Name() == "name");
  CHECK(prop.IndexedName() == "name");
  CHECK_FALSE(prop.HasIndex());
  CHECK(prop.Index().empty());
  CHECK_FALSE(prop.HasNext());
  CHECK(prop.Children().empty());
}

TEST_CASE("IndexedSegmentSplitsNameAndIndex", "[trellis][PropertyTokenizer]")
{
  Trellis::PropertyTokenizer prop{"items[0].price"};
  CHECK(prop.Name() == "items");
  CHECK(prop.Index() == "0");
  CHECK(prop.HasIndex());
  CHECK(prop.IndexedName() == "items[0]");
  CHECK(prop.HasNext());
  CHECK(prop.Children() == "price");
}

TEST_CASE("NextWalksEverySegment", "[trellis][PropertyTokenizer]")
{
  Trellis::PropertyTokenizer prop{"order.lines[2].product.tags[red]"};
  std::string rebuilt;
  int segments = 0;
  while (true)
  {
    ++segments;
    rebuilt.append(prop.IndexedName());
    if (!prop.HasNext())
      break;
    rebuilt.push_back('.');
    prop = prop.Next();
  }
  CHECK(segments == 4);
  CHECK(rebuilt == "order.lines[2].product.tags[red]");
  CHECK(prop.Name() == "tags");
  CHECK(prop.Index() == "red");
}

TEST_CASE("DotsInsideBracketsDoNotSplit", "[trellis][PropertyTokenizer]")
{
  Trellis::PropertyTokenizer prop{"attrs[a.b].c"};
  CHECK(prop.Name() == "attrs");
  CHECK(prop.Index() == "a.b");
  CHECK(prop.Children() == "c");
}

TEST_CASE("UnclosedBracketIsALiteralName", "[trellis][PropertyTokenizer]")
{
  Trellis::PropertyTokenizer prop{"a[b"};
  CHECK(prop.Name() == "a[b");
  CHECK_FALSE(prop.HasIndex());
  CHECK_FALSE(prop.HasNext());

  Trellis::PropertyTokenizer trailing{"a[0]x"};
  CHECK(trailing.Name() == "a[0]x");
  CHECK_FALSE(trailing.HasIndex());
}

TEST_CASE("LeadingIndexHasEmptyName", "[trellis][PropertyTokenizer]")
{
  Trellis::PropertyTokenizer prop{"[3]"};
  CHECK(prop.Name().empty());
  CHECK(prop.Index() == "3");
  CHECK(prop.IndexedName() == "[3]");
}

TEST_CASE("TrailingDotLeavesEmptyChildren", "[trellis][PropertyTokenizer]")
{
  Trellis::PropertyTokenizer prop{"a."};
  CHECK(prop.Name() == "a");
  CHECK(prop.HasNext());
  CHECK(prop.Children().empty());
  CHECK(prop.Next().Name().empty());
}

TEST_CASE("TokenizerOwnsItsText", "[trellis][PropertyTokenizer]")
{
  Trellis::PropertyTokenizer prop;
  {
    std::string path{"outer.inner"};
    prop = Trellis::PropertyTokenizer{path};
  }
  CHECK(prop.Name() == "outer");
  CHECK(prop.Children() == "inner");
}
