// Relatable.hpp
// Host objects carrying an ordered set of typed relations
#pragma once

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/Types.hpp>
#include <NGIN/Relations/RelationEvent.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <type_traits>

namespace NGIN::Relations
{

  class RelationBase;
  class RelationTypeBase;
  class ImmutableFlagType;
  template <class T>
  class Relation;
  template <class T>
  class RelationType;

  using RelationFilter = std::function<bool(const RelationBase &)>;

  /// Base of everything that can carry relations: plain objects, relation types and relations.
  ///
  /// Not thread-safe. Listener invocation order is registration order.
  class NGIN_RELATIONS_API Relatable
  {
  public:
    Relatable() noexcept;
    virtual ~Relatable();

    Relatable(const Relatable &) = delete;
    Relatable &operator=(const Relatable &) = delete;
    Relatable(Relatable &&) = delete;
    Relatable &operator=(Relatable &&) = delete;

    [[nodiscard]] virtual HostKind Kind() const noexcept { return HostKind::Object; }

    /// Stored value, else the type's default value (not stored), else the initial
    /// value which is stored as a new relation.
    template <class T>
    std::expected<T, Error> Get(RelationType<T> &type);

    /// Stored value or fallback; never creates a relation.
    template <class T>
    [[nodiscard]] T GetOr(const RelationType<T> &type, std::type_identity_t<T> fallback) const;

    /// Creates (ADD) or updates (UPDATE) the relation of the given type.
    template <class T>
    std::expected<Relation<T> *, Error> Set(RelationType<T> &type, std::type_identity_t<T> value);

    template <class T>
    [[nodiscard]] Relation<T> *GetRelation(const RelationType<T> &type) const noexcept;

    template <class T>
    std::expected<Relation<T> *, Error> Annotate(RelationType<T> &type, std::type_identity_t<T> value)
    {
      return Set(type, std::move(value));
    }

    std::expected<Relation<bool> *, Error> Annotate(RelationType<bool> &flag) { return SetFlag(flag); }

    /// Adds a relation whose value is resolved from an intermediate value on first read.
    /// Fails with IllegalMutation if a relation of the type already exists. Defined in
    /// IntermediateRelation.hpp.
    template <class T, class I>
    std::expected<Relation<T> *, Error> SetIntermediate(RelationType<T> &type, I intermediate,
                                                        std::type_identity_t<std::function<T(const I &)>> resolve);

    /// Adds an alias of this object's relation of the given type to inParent. Reads and
    /// writes through the alias go to the aliased relation; deleting that relation deletes
    /// its aliases. Defined in RelationWrapper.hpp.
    template <class T>
    std::expected<Relation<T> *, Error> AliasAs(RelationType<T> &type, RelationType<T> &aliasType,
                                                Relatable &inParent);

    /// Adds a read-only view of this object's relation to inParent, converting its value.
    /// Defined in RelationWrapper.hpp.
    template <class T, class V>
    std::expected<Relation<T> *, Error> ViewAs(RelationType<V> &type, RelationType<T> &viewType, Relatable &inParent,
                                               std::type_identity_t<std::function<T(const V &)>> convert);

    [[nodiscard]] RelationBase *GetRelation(const RelationTypeBase &type) const noexcept;
    [[nodiscard]] bool HasRelation(const RelationTypeBase &type) const noexcept;
    [[nodiscard]] bool HasRelations() const noexcept;

    /// Visible (non-private) relations in insertion order.
    [[nodiscard]] NGIN::Containers::Vector<RelationBase *> GetRelations(const RelationFilter &filter = {}) const;
    [[nodiscard]] NGIN::UIntSize RelationCount() const noexcept;

    [[nodiscard]] bool HasFlag(const RelationType<bool> &flag) const noexcept;
    std::expected<Relation<bool> *, Error> SetFlag(RelationType<bool> &flag);

    /// Materializes the relation's initial value without reading it.
    std::expected<void, Error> Init(RelationTypeBase &type);

    std::expected<Any, Error> GetAny(RelationTypeBase &type);
    std::expected<RelationBase *, Error> SetAny(RelationTypeBase &type, const Any &value);

    /// Deleting a type without a relation succeeds without effect.
    std::expected<void, Error> DeleteRelation(RelationTypeBase &type);
    std::expected<void, Error> DeleteRelations(const RelationFilter &filter);

    std::expected<void, Error> AddRelationListener(RelationListener &listener,
                                                   ListenerScope scope = ListenerScope::Relations);
    std::expected<void, Error> RemoveRelationListener(RelationListener &listener,
                                                      ListenerScope scope = ListenerScope::Relations);
    [[nodiscard]] const EventDispatcher *GetListeners(ListenerScope scope) const noexcept;

    /// True once frozen by the immutability flag (directly or through a frozen parent).
    [[nodiscard]] bool IsImmutable() const noexcept { return m_immutable; }

  private:
    friend class ImmutableFlagType;

    template <class T>
    std::expected<Relation<T> *, Error> AddNew(RelationType<T> &type, T value);

    [[nodiscard]] RelationBase *FindRelation(const RelationTypeBase &type) const noexcept;
    std::expected<void, Error> CheckHostMutable(const RelationTypeBase &type) const;
    std::expected<void, Error> CheckUpdateAllowed(const RelationBase &relation) const;
    std::expected<RelationBase *, Error> AddNewRelation(std::unique_ptr<RelationBase> relation);
    std::expected<void, Error> NotifyRelationListeners(EventType type, RelationBase &relation, const Any *updateValue);
    EventDispatcher &EnsureListeners(ListenerScope scope);
    [[nodiscard]] EventDispatcher *FindListeners(ListenerScope scope) const noexcept;

    // Freezes this object and, recursively, all of its relations.
    void FreezeRelations();

    // Relations removed while a dispatch is running on the current thread stay alive until
    // the outermost dispatch returns.
    class DispatchGuard
    {
    public:
      DispatchGuard() noexcept { BeginDispatch(); }
      ~DispatchGuard() { EndDispatch(); }

      DispatchGuard(const DispatchGuard &) = delete;
      DispatchGuard &operator=(const DispatchGuard &) = delete;
    };

    static void BeginDispatch() noexcept;
    static void EndDispatch();
    static void RetireRelation(std::unique_ptr<RelationBase> relation);

    NGIN::Containers::Vector<std::unique_ptr<RelationBase>> m_relations;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, RelationBase *> m_index;
    std::unique_ptr<EventDispatcher> m_listeners[ListenerScopeCount];
    bool m_immutable{false};
  };

  /// Capability of hosts that want to be told when the immutability flag freezes them.
  class NGIN_RELATIONS_API Freezable
  {
  public:
    virtual ~Freezable() = default;
    virtual void SetImmutable() = 0;
  };

  /// Copies the visible relations of source to target. Existing relations of target are
  /// only overwritten when replace is true.
  NGIN_RELATIONS_API std::expected<void, Error> CopyRelations(Relatable &source, Relatable &target, bool replace);

} // namespace NGIN::Relations
