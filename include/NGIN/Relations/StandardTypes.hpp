// StandardTypes.hpp
// Commonly used relation types
#pragma once

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/RelationType.hpp>

#include <string>

namespace NGIN::Relations::StandardTypes
{

  NGIN_RELATIONS_API extern RelationType<std::string> Name;
  NGIN_RELATIONS_API extern RelationType<std::string> Description;
  NGIN_RELATIONS_API extern RelationType<std::string> Info;

  NGIN_RELATIONS_API extern RelationType<int> Minimum;
  // Also the size limit of collector relations.
  NGIN_RELATIONS_API extern RelationType<int> Maximum;

} // namespace NGIN::Relations::StandardTypes
