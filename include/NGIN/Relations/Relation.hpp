// Relation.hpp
// A typed value bound to one host; relations can carry annotations of their own
#pragma once

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/Relatable.hpp>
#include <NGIN/Relations/Collections.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <optional>
#include <utility>

namespace NGIN::Relations
{

  template <class T, class V>
  class RelationWrapper;
  template <class T>
  class RelationAlias;

  class NGIN_RELATIONS_API RelationBase : public Relatable
  {
  public:
    explicit RelationBase(RelationTypeBase &type) noexcept : m_type(&type) {}
    ~RelationBase() override;

    [[nodiscard]] HostKind Kind() const noexcept override { return HostKind::Relation; }
    [[nodiscard]] RelationTypeBase &Type() const noexcept { return *m_type; }

    [[nodiscard]] virtual Any GetAnyTarget() const = 0;

    /// Replaces a collection value by its read-only view; no-op for other value types.
    virtual void ProtectTarget() = 0;

    /// Annotation on this relation, falling back to the same annotation on its type.
    template <class T>
    [[nodiscard]] std::optional<T> GetAnnotation(const RelationType<T> &annotation) const;

    [[nodiscard]] bool HasAnnotation(const RelationTypeBase &annotation) const noexcept;
    [[nodiscard]] bool HasFlagAnnotation(const RelationType<bool> &flag) const noexcept;

    /// The relation an alias or view reads from, nullptr for direct relations and for
    /// wrappers whose relation is gone.
    [[nodiscard]] virtual RelationBase *WrappedRelation() const noexcept { return nullptr; }
    [[nodiscard]] NGIN::UIntSize AliasCount() const noexcept { return m_aliases.Size(); }

  protected:
    // Called after the relation left its parent. Deletes the aliases and views of this relation.
    virtual std::expected<void, Error> Removed();

    // Wrapper side: the wrapped relation is going away; keep its last value.
    virtual void ReleaseWrapped() {}

    // Detaches all aliases and views; relations call this from their destructor.
    void ReleaseAliases();

  private:
    friend class Relatable;
    template <class T, class V>
    friend class RelationWrapper;

    struct AliasLink
    {
      Relatable *parent;
      RelationBase *alias;
    };

    void LinkAlias(Relatable &parent, RelationBase &alias);
    void UnlinkAlias(const RelationBase &alias);

    RelationTypeBase *m_type;
    NGIN::Containers::Vector<AliasLink> m_aliases;
  };

  template <class T>
  class Relation : public RelationBase
  {
  public:
    using ValueType = T;

    Relation(RelationType<T> &type, T target) : RelationBase(type), m_target(std::move(target)) {}
    ~Relation() override { this->ReleaseAliases(); }

    [[nodiscard]] RelationType<T> &GetType() const noexcept
    {
      return static_cast<RelationType<T> &>(Type());
    }

    [[nodiscard]] virtual T GetTarget() const { return m_target; }

    [[nodiscard]] Any GetAnyTarget() const override { return Any{GetTarget()}; }

    void ProtectTarget() override
    {
      if constexpr (detail::IsCollectionValue<T>)
      {
        if (!m_target.IsReadOnly())
          m_target = m_target.AsReadOnly();
      }
    }

  protected:
    // Checks of the relation itself, run before the UPDATE event.
    virtual std::expected<void, Error> PrepareTargetUpdate(T &) { return {}; }
    virtual void AssignTarget(T target) { m_target = std::move(target); }

    T m_target;

  private:
    friend class Relatable;
    friend class RelationType<T>;
    friend class RelationAlias<T>;
  };

} // namespace NGIN::Relations
