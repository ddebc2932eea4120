// IntermediateRelation.hpp
// Relations that keep an intermediate value until their target is first read
#pragma once

#include <NGIN/Relations/RelationType.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace NGIN::Relations
{

  /// Stores an intermediate value of type I and resolves it to the target on the first
  /// read. Assigning a target drops the intermediate value unresolved.
  template <class T, class I>
  class IntermediateRelation : public Relation<T>
  {
  public:
    using Resolver = std::function<T(const I &)>;

    IntermediateRelation(RelationType<T> &type, I intermediate, Resolver resolve)
        : Relation<T>(type, T{}), m_intermediate(std::move(intermediate)), m_resolve(std::move(resolve))
    {
    }

    ~IntermediateRelation() override { this->ReleaseAliases(); }

    [[nodiscard]] bool IsResolved() const noexcept { return !m_intermediate.has_value(); }

    /// nullptr once resolved.
    [[nodiscard]] const I *GetIntermediateTarget() const noexcept
    {
      return m_intermediate ? &*m_intermediate : nullptr;
    }

    [[nodiscard]] T GetTarget() const override
    {
      if (m_intermediate)
      {
        auto &self = const_cast<IntermediateRelation &>(*this);
        self.Relation<T>::AssignTarget(m_resolve(*m_intermediate));
        self.m_intermediate.reset();
      }
      return this->m_target;
    }

    void ProtectTarget() override
    {
      (void)GetTarget();
      Relation<T>::ProtectTarget();
    }

  protected:
    void AssignTarget(T target) override
    {
      m_intermediate.reset();
      Relation<T>::AssignTarget(std::move(target));
    }

  private:
    std::optional<I> m_intermediate;
    Resolver m_resolve;
  };

  template <class T, class I>
  std::expected<Relation<T> *, Error> Relatable::SetIntermediate(RelationType<T> &type, I intermediate,
                                                                 std::type_identity_t<std::function<T(const I &)>> resolve)
  {
    if (!resolve)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "intermediate relation without resolver", type.Name()});
    if (auto ok = CheckHostMutable(type); !ok)
      return std::unexpected(ok.error());
    if (FindRelation(type))
      return std::unexpected(Error{ErrorCode::IllegalMutation, "relation already exists", type.Name()});
    if (type.IsReadOnly())
      return std::unexpected(Error{ErrorCode::IllegalMutation, "relation type is read-only", type.Name()});

    auto added = AddNewRelation(
        std::make_unique<IntermediateRelation<T, I>>(type, std::move(intermediate), std::move(resolve)));
    if (!added)
      return std::unexpected(added.error());
    return static_cast<Relation<T> *>(*added);
  }

} // namespace NGIN::Relations
