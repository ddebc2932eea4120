// IntermediateTests.cpp - tests for relations resolved from an intermediate value

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Relations/Relations.hpp>

#include <string>

using namespace NGIN::Relations;

namespace IntermediateDemo
{
  struct Parse
  {
    int *calls;

    int operator()(const std::string &text) const
    {
      ++*calls;
      return std::stoi(text);
    }
  };

  struct Reader : RelationListener
  {
    int seen{-1};

    std::expected<void, Error> HandleEvent(const RelationEvent &event) override
    {
      seen = event.ValueAs<int>().value_or(-1);
      return {};
    }
  };
} // namespace IntermediateDemo

TEST_CASE("IntermediateValueIsResolvedOnFirstRead", "[relations][Intermediate]")
{
  auto count = NewIntType("test.intermediate.Count");
  Relatable o;
  int calls = 0;

  auto added = o.SetIntermediate(count, std::string{"42"}, IntermediateDemo::Parse{&calls});
  REQUIRE(added.has_value());
  auto *relation = dynamic_cast<IntermediateRelation<int, std::string> *>(*added);
  REQUIRE(relation != nullptr);
  CHECK_FALSE(relation->IsResolved());
  REQUIRE(relation->GetIntermediateTarget() != nullptr);
  CHECK(*relation->GetIntermediateTarget() == "42");
  CHECK(calls == 0);

  CHECK(o.Get(count).value() == 42);
  CHECK(calls == 1);
  CHECK(relation->IsResolved());
  CHECK(relation->GetIntermediateTarget() == nullptr);

  CHECK(o.Get(count).value() == 42);
  CHECK(calls == 1);
}

TEST_CASE("SettingIntermediateRelationDropsIntermediateValue", "[relations][Intermediate]")
{
  auto count = NewIntType("test.intermediate.Dropped");
  Relatable o;
  int calls = 0;

  REQUIRE(o.SetIntermediate(count, std::string{"42"}, IntermediateDemo::Parse{&calls}).has_value());
  REQUIRE(o.Set(count, 7).has_value());

  CHECK(o.Get(count).value() == 7);
  CHECK(calls == 0);
}

TEST_CASE("IntermediateRelationMustBeNew", "[relations][Intermediate]")
{
  auto count = NewIntType("test.intermediate.Existing");
  auto fixed = NewIntType("test.intermediate.ReadOnly", 0, Modifier::ReadOnly);
  Relatable o;
  int calls = 0;

  REQUIRE(o.Set(count, 1).has_value());
  auto existing = o.SetIntermediate(count, std::string{"2"}, IntermediateDemo::Parse{&calls});
  REQUIRE_FALSE(existing.has_value());
  CHECK(existing.error().code == ErrorCode::IllegalMutation);
  CHECK(o.Get(count).value() == 1);

  auto readOnly = o.SetIntermediate(fixed, std::string{"2"}, IntermediateDemo::Parse{&calls});
  REQUIRE_FALSE(readOnly.has_value());
  CHECK(readOnly.error().code == ErrorCode::IllegalMutation);

  auto unresolved = o.SetIntermediate(fixed, std::string{"2"}, nullptr);
  REQUIRE_FALSE(unresolved.has_value());
  CHECK(unresolved.error().code == ErrorCode::InvalidArgument);
  CHECK(calls == 0);
}

TEST_CASE("ListenersSeeResolvedIntermediateValue", "[relations][Intermediate]")
{
  auto count = NewIntType("test.intermediate.Observed");
  Relatable o;
  IntermediateDemo::Reader reader;
  int calls = 0;

  REQUIRE(o.AddRelationListener(reader).has_value());
  REQUIRE(o.SetIntermediate(count, std::string{"5"}, IntermediateDemo::Parse{&calls}).has_value());

  CHECK(reader.seen == 5);
  CHECK(calls == 1);
}

TEST_CASE("FreezingResolvesIntermediateRelations", "[relations][Intermediate]")
{
  auto count = NewIntType("test.intermediate.Frozen");
  Relatable o;
  int calls = 0;

  auto added = o.SetIntermediate(count, std::string{"9"}, IntermediateDemo::Parse{&calls});
  REQUIRE(added.has_value());
  REQUIRE(o.SetFlag(MetaTypes::Immutable).has_value());

  CHECK(calls == 1);
  auto *relation = dynamic_cast<IntermediateRelation<int, std::string> *>(*added);
  REQUIRE(relation != nullptr);
  CHECK(relation->IsResolved());
  CHECK(o.Get(count).value() == 9);
  CHECK(calls == 1);
}
