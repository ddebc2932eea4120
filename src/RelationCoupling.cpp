#include <NGIN/Relations/RelationCoupling.hpp>
#include <NGIN/Relations/RelationTypes.hpp>
#include <NGIN/Relations/Logging.hpp>

namespace NGIN::Relations
{

  namespace CouplingTypes
  {
    RelationType<CouplingList> Couplings = NewInitialValueType<CouplingList>(
        "CouplingTypes.Couplings", [](Relatable &)
        { return CouplingList{}; },
        Modifier::Transient);
  } // namespace CouplingTypes

  namespace
  {
    template <class Fn>
    std::expected<void, Error> ForEachCoupling(Relatable &host, const RelationFilter &filter, Fn fn)
    {
      // Couplings may replace or delete relations of host.
      NGIN::Containers::Vector<RelationTypeBase *> types;
      auto relations = host.GetRelations(filter);
      for (NGIN::UIntSize i = 0; i < relations.Size(); ++i)
        types.PushBack(&relations[i]->Type());

      for (NGIN::UIntSize i = 0; i < types.Size(); ++i)
      {
        auto *relation = host.GetRelation(*types[i]);
        if (!relation || !relation->HasRelation(CouplingTypes::Couplings))
          continue;
        const auto couplings = relation->GetOr(CouplingTypes::Couplings, CouplingList{}).ToVector();
        for (const auto &coupling : couplings)
        {
          if (auto ok = fn(*coupling); !ok)
          {
            Logger().debug("coupling of '{}' failed: {}", types[i]->Name(), ok.error().message);
            return ok;
          }
        }
      }
      return {};
    }
  } // namespace

  std::expected<void, Error> RelationCouplingBase::GetAll(Relatable &host, const RelationFilter &filter)
  {
    return ForEachCoupling(host, filter, [](RelationCouplingBase &coupling)
                           { return coupling.Query(); });
  }

  std::expected<void, Error> RelationCouplingBase::SetAll(Relatable &host, const RelationFilter &filter)
  {
    return ForEachCoupling(host, filter, [](RelationCouplingBase &coupling)
                           { return coupling.Update(); });
  }

  std::expected<void, Error> RelationCouplingBase::RemoveAll(Relatable &host, const RelationFilter &filter)
  {
    return ForEachCoupling(host, filter, [](RelationCouplingBase &coupling)
                           { return coupling.Remove(); });
  }

} // namespace NGIN::Relations
