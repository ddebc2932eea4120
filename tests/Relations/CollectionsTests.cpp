// CollectionsTests.cpp - tests for list, set and map values

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Relations/Collections.hpp>

#include <string>
#include <vector>

using namespace NGIN::Relations;

TEST_CASE("ListCopiesShareStorage", "[relations][Collections]")
{
  ListValue<int> list{1, 2};
  ListValue<int> copy = list;

  REQUIRE(copy.Add(3).has_value());
  CHECK(list.Size() == 3);
  CHECK(list.SharesStorage(copy));
  CHECK(list.Contains(3));

  REQUIRE(list.RemoveAt(0).has_value());
  CHECK(copy.ToVector() == std::vector<int>{2, 3});

  auto outOfRange = list.RemoveAt(5);
  REQUIRE_FALSE(outOfRange.has_value());
  CHECK(outOfRange.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ReadOnlyListRejectsMutation", "[relations][Collections]")
{
  ListValue<int> list{1};
  auto view = list.AsReadOnly();

  CHECK(view.IsReadOnly());
  CHECK_FALSE(list.IsReadOnly());
  CHECK(view.Add(2).error().code == ErrorCode::ImmutableViolation);
  CHECK(view.Remove(1).error().code == ErrorCode::ImmutableViolation);
  CHECK(view.Clear().error().code == ErrorCode::ImmutableViolation);

  REQUIRE(list.Add(2).has_value());
  CHECK(view.Size() == 2);
  CHECK(view == list);
}

TEST_CASE("SetKeepsInsertionOrderAndDistinctElements", "[relations][Collections]")
{
  SetValue<std::string> set;

  CHECK(set.Add("b").value());
  CHECK(set.Add("a").value());
  CHECK_FALSE(set.Add("b").value());
  CHECK(set.ToVector() == std::vector<std::string>{"b", "a"});

  CHECK(set.Remove("b").value());
  CHECK_FALSE(set.Remove("b").value());
  CHECK(set.Size() == 1);
  CHECK(SetValue<int>{3, 1, 3} == SetValue<int>{3, 1});
}

TEST_CASE("MapReplacesValuesInPlace", "[relations][Collections]")
{
  MapValue<std::string, int> map;

  REQUIRE(map.Put("x", 1).has_value());
  REQUIRE(map.Put("y", 2).has_value());
  REQUIRE(map.Put("x", 3).has_value());

  CHECK(map.Keys() == std::vector<std::string>{"x", "y"});
  CHECK(map.Get("x").value() == 3);
  CHECK_FALSE(map.Get("z").has_value());
  CHECK(map.ContainsKey("y"));

  auto view = map.AsReadOnly();
  CHECK(view.Put("z", 4).error().code == ErrorCode::ImmutableViolation);
  REQUIRE(map.Remove("y").value());
  CHECK(view.Size() == 1);
}
