// AutomaticType.hpp
// Relation types that listen to the changes of the object they are bound to
#pragma once

#include <NGIN/Relations/RelationType.hpp>
#include <NGIN/Relations/RelationEvent.hpp>
#include <NGIN/Relations/Logging.hpp>

namespace NGIN::Relations
{

  /// Base of reactive relation types.
  ///
  /// When a relation of this type is added to a parent the type registers itself as a
  /// listener of the parent: in the relation listeners of plain objects, the update
  /// listeners of relations and the type listeners of relation types. It deregisters when
  /// the relation is deleted. Events of the type's own relation go to OnOwnEvent(), all
  /// others to ProcessEvent(). The relation carrying the derived value is found on the
  /// event scope, see OwnRelation().
  template <class T>
  class AutomaticType : public RelationType<T>, public RelationListener
  {
  public:
    using RelationType<T>::RelationType;

    std::expected<void, Error> HandleEvent(const RelationEvent &event) override
    {
      if (&event.ElementType() == static_cast<const RelationTypeBase *>(this))
        return OnOwnEvent(event);
      return ProcessEvent(event);
    }

  protected:
    virtual std::expected<void, Error> ProcessEvent(const RelationEvent &event) = 0;

    virtual std::expected<void, Error> OnOwnEvent(const RelationEvent &) { return {}; }

    [[nodiscard]] virtual ListenerScope ScopeFor(const Relatable &parent) const noexcept
    {
      return ScopeForHost(parent.Kind());
    }

    /// The relation of this type living on the event's scope, nullptr if there is none.
    [[nodiscard]] Relation<T> *OwnRelation(const RelationEvent &event) const noexcept
    {
      return event.EventScope().GetRelation(*this);
    }

    /// OwnRelation() for a derived update. A frozen own relation rejects the update, except for
    /// the event that froze the source itself, which yields nullptr.
    std::expected<Relation<T> *, Error> UpdatableOwnRelation(const RelationEvent &event) const
    {
      auto *own = OwnRelation(event);
      if (!own || !own->IsImmutable())
        return own;
      if (event.Source().IsImmutable())
        return nullptr;
      Logger().debug("'{}' cannot derive a value on an immutable relation", this->Name());
      return std::unexpected(Error{ErrorCode::ImmutableViolation, "relation is immutable", this->Name()});
    }

    std::expected<void, Error> AttachRelation(Relatable &parent, RelationBase &relation) override
    {
      if (this->IsFinal() || this->IsReadOnly())
        relation.ProtectTarget();
      if (auto ok = parent.AddRelationListener(*this, ScopeFor(parent)); !ok)
        return ok;
      Logger().trace("'{}' listening on {} scope", this->Name(), static_cast<unsigned>(ScopeFor(parent)));
      return {};
    }

    std::expected<void, Error> DetachRelation(Relatable &parent, RelationBase &) override
    {
      if (auto ok = parent.RemoveRelationListener(*this, ScopeFor(parent)); !ok)
        return ok;
      Logger().trace("'{}' stopped listening", this->Name());
      return {};
    }
  };

} // namespace NGIN::Relations
