#pragma once

#include <string_view>

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/Types.hpp>
#include <NGIN/Relations/Logging.hpp>
#include <NGIN/Relations/Collections.hpp>
#include <NGIN/Relations/RelationEvent.hpp>
#include <NGIN/Relations/Relatable.hpp>
#include <NGIN/Relations/Relation.hpp>
#include <NGIN/Relations/RelationType.hpp>
#include <NGIN/Relations/RelationTypes.hpp>
#include <NGIN/Relations/RelationWrapper.hpp>
#include <NGIN/Relations/IntermediateRelation.hpp>
#include <NGIN/Relations/RelationCoupling.hpp>
#include <NGIN/Relations/AutomaticType.hpp>
#include <NGIN/Relations/CounterType.hpp>
#include <NGIN/Relations/CollectorType.hpp>
#include <NGIN/Relations/ConstraintType.hpp>
#include <NGIN/Relations/ListenerType.hpp>
#include <NGIN/Relations/TimerType.hpp>
#include <NGIN/Relations/StandardTypes.hpp>
#include <NGIN/Relations/MetaTypes.hpp>

namespace NGIN::Relations
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Relations"; }

} // namespace NGIN::Relations
