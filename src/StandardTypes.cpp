#include <NGIN/Relations/StandardTypes.hpp>
#include <NGIN/Relations/RelationTypes.hpp>

namespace NGIN::Relations::StandardTypes
{

  RelationType<std::string> Name = NewType<std::string>("StandardTypes.Name");
  RelationType<std::string> Description = NewType<std::string>("StandardTypes.Description");
  RelationType<std::string> Info = NewType<std::string>("StandardTypes.Info");

  RelationType<int> Minimum = NewIntType("StandardTypes.Minimum");
  RelationType<int> Maximum = NewIntType("StandardTypes.Maximum");

} // namespace NGIN::Relations::StandardTypes
