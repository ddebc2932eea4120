// AnnotationTests.cpp - tests for annotations on relations and relation types

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Relations/Relations.hpp>

#include <string>

using namespace NGIN::Relations;

TEST_CASE("RelationAnnotationFallsBackToType", "[relations][Annotations]")
{
  auto size = NewIntType("test.annotations.Size");
  Relatable o;

  REQUIRE(size.Annotate(StandardTypes::Maximum, 10).has_value());
  REQUIRE(size.Annotate(StandardTypes::Description, "a size").has_value());
  auto *relation = o.Set(size, 3).value();

  CHECK(relation->GetAnnotation(StandardTypes::Maximum).value() == 10);
  CHECK(relation->HasAnnotation(StandardTypes::Maximum));
  CHECK_FALSE(relation->HasAnnotation(StandardTypes::Minimum));
  CHECK_FALSE(relation->GetAnnotation(StandardTypes::Minimum).has_value());

  REQUIRE(relation->Annotate(StandardTypes::Maximum, 5).has_value());
  CHECK(relation->GetAnnotation(StandardTypes::Maximum).value() == 5);
  CHECK(size.Get(StandardTypes::Maximum).value() == 10);
}

TEST_CASE("FlagAnnotations", "[relations][Annotations]")
{
  auto title = NewType<std::string>("test.annotations.Title");
  auto subtitle = NewType<std::string>("test.annotations.Subtitle");
  Relatable o;

  REQUIRE(title.Annotate(MetaTypes::Mandatory).has_value());
  auto *mandatory = o.Set(title, "t").value();
  auto *optional = o.Set(subtitle, "s").value();

  CHECK(title.HasFlag(MetaTypes::Mandatory));
  CHECK(mandatory->HasFlagAnnotation(MetaTypes::Mandatory));
  CHECK_FALSE(optional->HasFlagAnnotation(MetaTypes::Mandatory));

  REQUIRE(optional->Annotate(MetaTypes::Optional).has_value());
  CHECK(optional->HasFlagAnnotation(MetaTypes::Optional));

  REQUIRE(mandatory->Set(MetaTypes::Mandatory, false).has_value());
  CHECK_FALSE(mandatory->HasFlagAnnotation(MetaTypes::Mandatory));
}

TEST_CASE("AnnotationsAreRelationsOfTheirOwn", "[relations][Annotations]")
{
  auto weight = NewIntType("test.annotations.Weight");
  auto unit = NewType<std::string>("test.annotations.Unit");
  Relatable o;

  auto *relation = o.Set(weight, 80).value();
  REQUIRE(relation->Annotate(unit, "kg").has_value());

  auto annotations = relation->GetRelations();
  REQUIRE(annotations.Size() == 1);
  CHECK(&annotations[0]->Type() == &unit);
  CHECK(annotations[0]->GetAnyTarget().Cast<std::string>() == "kg");
  CHECK(o.RelationCount() == 1);
}
