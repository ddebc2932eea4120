// ConstraintTests.cpp - tests for value constraints

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Relations/Relations.hpp>

using namespace NGIN::Relations;

TEST_CASE("ConstraintRejectsInvalidUpdates", "[relations][Constraint]")
{
  auto positive = NewConstraint<int>("test.constraint.Positive", [](const int &v)
                                     { return v >= 0; });
  Relatable o;

  REQUIRE(o.Set(positive, 5).has_value());
  CHECK(o.Get(positive).value() == 5);

  auto rejected = o.Set(positive, -1);
  REQUIRE_FALSE(rejected.has_value());
  CHECK(rejected.error().code == ErrorCode::ConstraintViolation);
  CHECK(rejected.error().relation == positive.Name());
  CHECK(o.Get(positive).value() == 5);

  REQUIRE(o.Set(positive, 0).has_value());
  CHECK(o.Get(positive).value() == 0);
}

TEST_CASE("ConstraintRejectsInvalidInitialValue", "[relations][Constraint]")
{
  auto positive = NewConstraint<int>("test.constraint.Initial", [](const int &v)
                                     { return v >= 0; });
  Relatable o;

  auto rejected = o.Set(positive, -1);
  REQUIRE_FALSE(rejected.has_value());
  CHECK(rejected.error().code == ErrorCode::ConstraintViolation);
  CHECK_FALSE(o.HasRelation(positive));
  REQUIRE(o.GetListeners(ListenerScope::Relations) != nullptr);
  CHECK(o.GetListeners(ListenerScope::Relations)->Size() == 0);
}

TEST_CASE("ConstraintOnRelationValidatesAnnotation", "[relations][Constraint]")
{
  auto value = NewIntType("test.constraint.Annotated");
  auto weight = NewConstraint<int>("test.constraint.Weight", [](const int &v)
                                   { return v <= 10; });
  Relatable o;

  auto *relation = o.Set(value, 1).value();
  REQUIRE(relation->Set(weight, 10).has_value());
  auto rejected = relation->Set(weight, 11);
  REQUIRE_FALSE(rejected.has_value());
  CHECK(rejected.error().code == ErrorCode::ConstraintViolation);
  CHECK(relation->Get(weight).value() == 10);
}

TEST_CASE("ConstraintIgnoresOtherRelationsAndDeletion", "[relations][Constraint]")
{
  auto positive = NewConstraint<int>("test.constraint.Scoped", [](const int &v)
                                     { return v >= 0; });
  auto other = NewIntType("test.constraint.Other");
  Relatable o;

  REQUIRE(o.Set(positive, 1).has_value());
  REQUIRE(o.Set(other, -5).has_value());
  REQUIRE(o.DeleteRelation(positive).has_value());
  CHECK_FALSE(o.HasRelation(positive));
  CHECK(o.GetListeners(ListenerScope::Relations)->Size() == 0);
}
