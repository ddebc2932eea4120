// MetaTypes.hpp
// Relation types describing other objects and relations, including the immutability flag
#pragma once

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/AutomaticType.hpp>

namespace NGIN::Relations
{

  /// Final boolean flag that freezes its parent when set to true.
  ///
  /// Binding it (only legal with true) freezes every existing relation of the parent,
  /// recursively including their annotations, and replaces list, set and map values by
  /// read-only views. Parents implementing Freezable are notified. The flag then becomes
  /// the last relation listener of the parent and the listener list is frozen; any later
  /// change fails with ImmutableViolation. Values inside frozen collections are not frozen.
  class NGIN_RELATIONS_API ImmutableFlagType : public AutomaticType<bool>
  {
  public:
    explicit ImmutableFlagType(std::string_view name);

  protected:
    std::expected<void, Error> AttachRelation(Relatable &parent, RelationBase &relation) override;
    std::expected<void, Error> ProcessEvent(const RelationEvent &event) override;

    [[nodiscard]] ListenerScope ScopeFor(const Relatable &) const noexcept override
    {
      return ListenerScope::Relations;
    }
  };

  namespace MetaTypes
  {
    NGIN_RELATIONS_API extern ImmutableFlagType Immutable;

    NGIN_RELATIONS_API extern RelationType<bool> Mandatory;
    NGIN_RELATIONS_API extern RelationType<bool> Optional;
    NGIN_RELATIONS_API extern RelationType<bool> Ordered;
    NGIN_RELATIONS_API extern RelationType<bool> Modified;
  } // namespace MetaTypes

} // namespace NGIN::Relations
