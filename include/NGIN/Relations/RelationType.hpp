// RelationType.hpp
// Named, typed relation descriptors, their global registry, and the typed host accessors
#pragma once

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/Types.hpp>
#include <NGIN/Relations/Relatable.hpp>
#include <NGIN/Relations/Relation.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

namespace NGIN::Relations
{

  /// Untyped part of a relation descriptor.
  ///
  /// Descriptors register under their name on construction and unregister on destruction.
  /// They are neither copyable nor movable; bindings refer to them by address.
  class NGIN_RELATIONS_API RelationTypeBase : public Relatable
  {
  public:
    RelationTypeBase(std::string_view name, NGIN::UInt64 valueTypeId, std::string_view valueTypeName,
                     Modifiers modifiers);
    ~RelationTypeBase() override;

    [[nodiscard]] HostKind Kind() const noexcept override { return HostKind::RelationType; }

    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    /// Text before the last '.', empty for unqualified names.
    [[nodiscard]] std::string_view Namespace() const noexcept;
    [[nodiscard]] std::string_view SimpleName() const noexcept;

    [[nodiscard]] NGIN::UInt64 ValueTypeId() const noexcept { return m_valueTypeId; }
    [[nodiscard]] std::string_view ValueTypeName() const noexcept { return m_valueTypeName; }

    [[nodiscard]] Modifiers GetModifiers() const noexcept { return m_modifiers; }
    [[nodiscard]] bool HasModifier(Modifier m) const noexcept { return m_modifiers.Has(m); }
    [[nodiscard]] bool IsFinal() const noexcept { return m_modifiers.Has(Modifier::Final); }
    [[nodiscard]] bool IsReadOnly() const noexcept { return m_modifiers.Has(Modifier::ReadOnly); }
    [[nodiscard]] bool IsPrivate() const noexcept { return m_modifiers.Has(Modifier::Private); }
    [[nodiscard]] bool IsTransient() const noexcept { return m_modifiers.Has(Modifier::Transient); }

    [[nodiscard]] bool IsRegistered() const noexcept { return m_registered; }

    [[nodiscard]] static RelationTypeBase *ValueOf(std::string_view name) noexcept;
    [[nodiscard]] static NGIN::Containers::Vector<RelationTypeBase *> GetRegisteredRelationTypes();
    [[nodiscard]] static NGIN::Containers::Vector<RelationTypeBase *> GetRelationTypes(
        const std::function<bool(const RelationTypeBase &)> &filter);

    // Type-erased access for Relatable::GetAny/SetAny/Init.
    virtual std::expected<Any, Error> GetAnyFrom(Relatable &host) = 0;
    virtual std::expected<RelationBase *, Error> SetAnyOn(Relatable &host, const Any &value) = 0;
    virtual std::expected<void, Error> InitOn(Relatable &host) = 0;

  protected:
    friend class Relatable;

    // Called before the ADD event of a new relation; an error cancels the addition.
    virtual std::expected<void, Error> AttachRelation(Relatable &parent, RelationBase &relation);
    // Called before a relation is removed from its parent.
    virtual std::expected<void, Error> DetachRelation(Relatable &parent, RelationBase &relation);

  private:
    std::string_view m_name;
    NGIN::UInt64 m_valueTypeId;
    std::string_view m_valueTypeName;
    Modifiers m_modifiers;
    bool m_registered{false};
  };

  template <class T>
  class RelationType : public RelationTypeBase
  {
  public:
    using ValueType = T;
    using ValueFunction = std::function<T(Relatable &)>;

    explicit RelationType(std::string_view name, Modifiers modifiers = {})
        : RelationTypeBase(name, detail::TypeIdOf<T>(), detail::TypeNameOf<T>(), modifiers)
    {
    }

    RelationType(std::string_view name, ValueFunction defaultValue, ValueFunction initialValue,
                 Modifiers modifiers = {})
        : RelationTypeBase(name, detail::TypeIdOf<T>(), detail::TypeNameOf<T>(), modifiers),
          m_defaultValue(std::move(defaultValue)), m_initialValue(std::move(initialValue))
    {
    }

    [[nodiscard]] virtual bool HasDefaultValue() const noexcept { return static_cast<bool>(m_defaultValue); }
    [[nodiscard]] virtual T DefaultValue(Relatable &parent) const
    {
      return m_defaultValue ? m_defaultValue(parent) : T{};
    }

    /// Collection-typed descriptors always have an (empty) initial value.
    [[nodiscard]] virtual bool HasInitialValue() const noexcept
    {
      return static_cast<bool>(m_initialValue) || detail::IsCollectionValue<T>;
    }
    [[nodiscard]] virtual T InitialValue(Relatable &parent) const
    {
      return m_initialValue ? m_initialValue(parent) : T{};
    }

    [[nodiscard]] virtual std::unique_ptr<Relation<T>> NewRelation(T target)
    {
      return std::make_unique<Relation<T>>(*this, std::move(target));
    }

    /// Hook invoked before the UPDATE event; may adjust the proposed value or reject it.
    virtual std::expected<void, Error> PrepareRelationUpdate(Relatable &, Relation<T> &, T &) { return {}; }

    std::expected<Any, Error> GetAnyFrom(Relatable &host) override
    {
      auto value = host.Get(*this);
      if (!value)
        return std::unexpected(value.error());
      return Any{std::move(*value)};
    }

    std::expected<RelationBase *, Error> SetAnyOn(Relatable &host, const Any &value) override
    {
      if (value.GetTypeId() != ValueTypeId())
        return std::unexpected(Error{ErrorCode::TypeMismatch, "value type does not match relation type", Name()});
      auto result = host.Set(*this, value.template Cast<T>());
      if (!result)
        return std::unexpected(result.error());
      return *result;
    }

    std::expected<void, Error> InitOn(Relatable &host) override
    {
      auto value = host.Get(*this);
      if (!value)
        return std::unexpected(value.error());
      return {};
    }

  protected:
    // Internal update path: bypasses modifier checks and raises no events. Frozen relations
    // still reject the change.
    static std::expected<void, Error> SetRelationTarget(Relation<T> &relation, T target)
    {
      if (relation.IsImmutable())
        return std::unexpected(Error{ErrorCode::ImmutableViolation, "relation is immutable", relation.Type().Name()});
      relation.AssignTarget(std::move(target));
      return {};
    }

  private:
    ValueFunction m_defaultValue;
    ValueFunction m_initialValue;
  };

  // ---- Relatable typed accessors ----

  template <class T>
  Relation<T> *Relatable::GetRelation(const RelationType<T> &type) const noexcept
  {
    return static_cast<Relation<T> *>(FindRelation(type));
  }

  template <class T>
  std::expected<T, Error> Relatable::Get(RelationType<T> &type)
  {
    if (auto *relation = GetRelation(type))
      return relation->GetTarget();
    if (type.HasDefaultValue())
      return type.DefaultValue(*this);
    if (!type.HasInitialValue())
      return T{};

    T initial = type.InitialValue(*this);
    // Frozen hosts stay readable but cannot materialize new relations.
    if (m_immutable)
      return initial;
    auto added = AddNew(type, std::move(initial));
    if (!added)
      return std::unexpected(added.error());
    return (*added)->GetTarget();
  }

  template <class T>
  T Relatable::GetOr(const RelationType<T> &type, std::type_identity_t<T> fallback) const
  {
    if (auto *relation = GetRelation(type))
      return relation->GetTarget();
    return fallback;
  }

  template <class T>
  std::expected<Relation<T> *, Error> Relatable::Set(RelationType<T> &type, std::type_identity_t<T> value)
  {
    if (auto ok = CheckHostMutable(type); !ok)
      return std::unexpected(ok.error());

    auto *relation = GetRelation(type);
    if (!relation)
    {
      if (type.IsReadOnly())
        return std::unexpected(Error{ErrorCode::IllegalMutation, "relation type is read-only", type.Name()});
      return AddNew(type, std::move(value));
    }

    if (auto ok = CheckUpdateAllowed(*relation); !ok)
      return std::unexpected(ok.error());
    if (auto ok = type.PrepareRelationUpdate(*this, *relation, value); !ok)
      return std::unexpected(ok.error());
    if (auto ok = relation->PrepareTargetUpdate(value); !ok)
      return std::unexpected(ok.error());

    // A listener may delete the relation while handling the update; the guard keeps it
    // alive until this call returns.
    const DispatchGuard guard;
    const Any update{value};
    if (auto ok = NotifyRelationListeners(EventType::Update, *relation, &update); !ok)
      return std::unexpected(ok.error());

    if (FindRelation(type) != relation)
      return std::unexpected(Error{ErrorCode::NotFound, "relation removed during update", type.Name()});

    relation->AssignTarget(std::move(value));
    return relation;
  }

  template <class T>
  std::expected<Relation<T> *, Error> Relatable::AddNew(RelationType<T> &type, T value)
  {
    auto added = AddNewRelation(type.NewRelation(std::move(value)));
    if (!added)
      return std::unexpected(added.error());
    return static_cast<Relation<T> *>(*added);
  }

  template <class T>
  std::optional<T> RelationBase::GetAnnotation(const RelationType<T> &annotation) const
  {
    if (auto *own = GetRelation(annotation))
      return own->GetTarget();
    if (auto *inherited = Type().GetRelation(annotation))
      return inherited->GetTarget();
    return std::nullopt;
  }

} // namespace NGIN::Relations
