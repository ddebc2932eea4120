#include <NGIN/Relations/Relations.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace Demo {
  using namespace NGIN::Relations;

  // A score that has to stay within 0..100.
  inline ConstraintType<int> Score = NewConstraint<int>("Demo.Score", [](const int &v) { return v >= 0 && v <= 100; });

  inline CounterType<int> Changes = NewIntCounter("Demo.Changes", [](const RelationEvent &e) {
    return e.Type() != EventType::Remove;
  });

  inline DistinctCollectorType<std::string> Names = NewDistinctCollector<std::string>(
      "Demo.Names", [](const RelationBase &relation, const Any &value) -> std::optional<std::string> {
        if (&relation.Type() != &StandardTypes::Name)
          return std::nullopt;
        return value.Cast<std::string>();
      });
}

int main() {
  using namespace NGIN::Relations;
  std::cout << "Library: " << LibraryName() << "\n";

  Relatable player;
  (void)player.Init(Demo::Changes);
  (void)player.Init(Demo::Names);

  (void)player.Set(StandardTypes::Name, "Ada");
  (void)player.Set(Demo::Score, 42);
  (void)player.Set(StandardTypes::Name, "Grace");

  if (auto rejected = player.Set(Demo::Score, 120); !rejected)
    std::cout << "Score 120 rejected: " << ToString(rejected.error().code) << "\n";

  std::cout << "Name: " << player.Get(StandardTypes::Name).value() << "\n";
  std::cout << "Score: " << player.Get(Demo::Score).value() << "\n";
  std::cout << "Changes: " << player.Get(Demo::Changes).value() << "\n";
  std::cout << "Names seen:";
  for (const auto &name : player.Get(Demo::Names).value())
    std::cout << " " << name;
  std::cout << "\n";

  (void)player.SetFlag(MetaTypes::Immutable);
  if (auto frozen = player.Set(StandardTypes::Name, "Linus"); !frozen)
    std::cout << "After freezing: " << ToString(frozen.error().code) << "\n";

  std::cout << "Relation types:";
  for (auto *type : RelationTypeBase::GetRegisteredRelationTypes())
    if (type->Namespace() == "Demo")
      std::cout << " " << type->SimpleName() << "<" << type->ValueTypeName() << ">";
  std::cout << "\n";

  std::cout << "TypeName<Relatable>::qualified: "
            << NGIN::Meta::TypeName<Relatable>::qualifiedName << "\n";
  return 0;
}
