// RelationWrapper.hpp
// Aliases and views: relations on one host that read the relation of another
#pragma once

#include <NGIN/Relations/RelationType.hpp>
#include <NGIN/Relations/Logging.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace NGIN::Relations
{

  /// Relation of type T whose value is read from a relation of type V, possibly on another
  /// host. When the wrapped relation is deleted its wrappers are deleted too; when it is
  /// destroyed without deletion the wrapper keeps the last value.
  template <class T, class V>
  class RelationWrapper : public Relation<T>
  {
  public:
    using Conversion = std::function<T(const V &)>;

    RelationWrapper(RelationType<T> &type, Relation<V> &wrapped, Relatable &wrappedParent, Conversion convert)
        : Relation<T>(type, T{}), m_wrapped(&wrapped), m_wrappedParent(&wrappedParent), m_convert(std::move(convert))
    {
    }

    ~RelationWrapper() override
    {
      if (!m_wrapped)
        return;
      m_wrapped->UnlinkAlias(*this);
      ReleaseWrapped();
    }

    [[nodiscard]] T GetTarget() const override
    {
      T value = m_wrapped ? m_convert(m_wrapped->GetTarget()) : this->m_target;
      if constexpr (detail::IsCollectionValue<T>)
      {
        if (m_protected && !value.IsReadOnly())
          return value.AsReadOnly();
      }
      return value;
    }

    void ProtectTarget() override
    {
      m_protected = true;
      Relation<T>::ProtectTarget();
    }

    [[nodiscard]] RelationBase *WrappedRelation() const noexcept override { return m_wrapped; }

  protected:
    [[nodiscard]] Relation<V> *Wrapped() const noexcept { return m_wrapped; }
    [[nodiscard]] Relatable &WrappedParent() const noexcept { return *m_wrappedParent; }

    std::expected<void, Error> Removed() override
    {
      if (m_wrapped)
      {
        m_wrapped->UnlinkAlias(*this);
        ReleaseWrapped();
      }
      return RelationBase::Removed();
    }

    void ReleaseWrapped() override
    {
      if (!m_wrapped)
        return;
      this->m_target = m_convert(m_wrapped->GetTarget());
      m_wrapped = nullptr;
    }

    void Link(Relatable &parent) { m_wrapped->LinkAlias(parent, *this); }

  private:
    template <class>
    friend class RelationAlias;
    friend class Relatable;

    Relation<V> *m_wrapped;
    Relatable *m_wrappedParent;
    Conversion m_convert;
    bool m_protected{false};
  };

  /// Writable alias under another type. Updates pass the checks of the aliased relation and
  /// its type and change the aliased value without raising events on its host.
  template <class T>
  class RelationAlias : public RelationWrapper<T, T>
  {
  public:
    RelationAlias(RelationType<T> &type, Relation<T> &aliased, Relatable &aliasedParent)
        : RelationWrapper<T, T>(type, aliased, aliasedParent, [](const T &value)
                                { return value; })
    {
    }

  protected:
    std::expected<void, Error> PrepareTargetUpdate(T &value) override
    {
      auto *aliased = this->Wrapped();
      if (!aliased)
        return std::unexpected(Error{ErrorCode::NotFound, "aliased relation no longer exists", this->Type().Name()});
      auto &aliasedType = aliased->GetType();
      if (aliased->IsImmutable() || this->WrappedParent().IsImmutable())
        return std::unexpected(Error{ErrorCode::ImmutableViolation, "aliased relation is immutable", aliasedType.Name()});
      if (aliasedType.IsFinal() || aliasedType.IsReadOnly())
        return std::unexpected(Error{ErrorCode::IllegalMutation, "aliased relation type is final or read-only",
                                     aliasedType.Name()});
      if (auto ok = aliasedType.PrepareRelationUpdate(this->WrappedParent(), *aliased, value); !ok)
        return ok;
      return aliased->PrepareTargetUpdate(value);
    }

    void AssignTarget(T target) override
    {
      if (auto *aliased = this->Wrapped())
        aliased->AssignTarget(std::move(target));
    }
  };

  /// Read-only view under a type of another value type.
  template <class T, class V>
  class RelationView : public RelationWrapper<T, V>
  {
  public:
    using RelationWrapper<T, V>::RelationWrapper;

  protected:
    std::expected<void, Error> PrepareTargetUpdate(T &) override
    {
      return std::unexpected(Error{ErrorCode::IllegalMutation, "relation view is read-only", this->Type().Name()});
    }
  };

  template <class T>
  std::expected<Relation<T> *, Error> Relatable::AliasAs(RelationType<T> &type, RelationType<T> &aliasType,
                                                         Relatable &inParent)
  {
    auto *aliased = GetRelation(type);
    if (!aliased)
      return std::unexpected(Error{ErrorCode::NotFound, "no relation to alias", type.Name()});
    if (inParent.HasRelation(aliasType))
      return std::unexpected(Error{ErrorCode::IllegalMutation, "relation already exists", aliasType.Name()});

    auto alias = std::make_unique<RelationAlias<T>>(aliasType, *aliased, *this);
    auto *raw = alias.get();
    auto added = inParent.AddNewRelation(std::move(alias));
    if (!added)
      return std::unexpected(added.error());
    raw->Link(inParent);
    Logger().trace("'{}' aliased as '{}'", type.Name(), aliasType.Name());
    return raw;
  }

  template <class T, class V>
  std::expected<Relation<T> *, Error> Relatable::ViewAs(RelationType<V> &type, RelationType<T> &viewType,
                                                        Relatable &inParent,
                                                        std::type_identity_t<std::function<T(const V &)>> convert)
  {
    if (!convert)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "view without conversion", viewType.Name()});
    auto *viewed = GetRelation(type);
    if (!viewed)
      return std::unexpected(Error{ErrorCode::NotFound, "no relation to view", type.Name()});
    if (inParent.HasRelation(viewType))
      return std::unexpected(Error{ErrorCode::IllegalMutation, "relation already exists", viewType.Name()});

    auto view = std::make_unique<RelationView<T, V>>(viewType, *viewed, *this, std::move(convert));
    auto *raw = view.get();
    auto added = inParent.AddNewRelation(std::move(view));
    if (!added)
      return std::unexpected(added.error());
    raw->Link(inParent);
    Logger().trace("'{}' viewed as '{}'", type.Name(), viewType.Name());
    return raw;
  }

} // namespace NGIN::Relations
