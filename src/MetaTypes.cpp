#include <NGIN/Relations/MetaTypes.hpp>
#include <NGIN/Relations/RelationTypes.hpp>
#include <NGIN/Relations/Logging.hpp>

namespace NGIN::Relations
{

  ImmutableFlagType::ImmutableFlagType(std::string_view name)
      : AutomaticType<bool>(name, [](Relatable &)
                            { return false; }, nullptr, Modifier::Final)
  {
  }

  std::expected<void, Error> ImmutableFlagType::AttachRelation(Relatable &parent, RelationBase &relation)
  {
    if (!static_cast<Relation<bool> &>(relation).GetTarget())
      return std::unexpected(Error{ErrorCode::IllegalMutation, "immutable flag can only be set to true", Name()});

    parent.FreezeRelations();
    // The flag relation is not yet part of the parent.
    static_cast<Relatable &>(relation).FreezeRelations();
    if (auto *freezable = dynamic_cast<Freezable *>(&parent))
      freezable->SetImmutable();

    auto &listeners = parent.EnsureListeners(ListenerScope::Relations);
    if (auto ok = listeners.Add(*this); !ok)
      return ok;
    listeners.Freeze();

    Logger().debug("object frozen by '{}' ({} relations)", Name(), parent.RelationCount());
    return {};
  }

  std::expected<void, Error> ImmutableFlagType::ProcessEvent(const RelationEvent &event)
  {
    Logger().debug("rejected {} of '{}' on immutable object", ToString(event.Type()), event.ElementType().Name());
    return std::unexpected(Error{ErrorCode::ImmutableViolation, "object is immutable", event.ElementType().Name()});
  }

  namespace MetaTypes
  {
    ImmutableFlagType Immutable{"MetaTypes.Immutable"};

    RelationType<bool> Mandatory = NewFlagType("MetaTypes.Mandatory");
    RelationType<bool> Optional = NewFlagType("MetaTypes.Optional");
    RelationType<bool> Ordered = NewFlagType("MetaTypes.Ordered");
    RelationType<bool> Modified = NewFlagType("MetaTypes.Modified");
  } // namespace MetaTypes

} // namespace NGIN::Relations
