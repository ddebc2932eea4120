// ConstraintType.hpp
// Relation type validating every value proposed for its own relation
#pragma once

#include <NGIN/Relations/AutomaticType.hpp>

#include <functional>
#include <utility>

namespace NGIN::Relations
{

  /// Rejects additions and updates whose proposed value fails the predicate with
  /// ConstraintViolation. The check runs during the pre-image dispatch so a rejected value
  /// never becomes visible. Listens in the relation listeners of its parent regardless of
  /// the parent's kind.
  template <class T>
  class ConstraintType : public AutomaticType<T>
  {
  public:
    using ValuePredicate = std::function<bool(const T &)>;

    ConstraintType(std::string_view name, ValuePredicate predicate, Modifiers modifiers = {})
        : AutomaticType<T>(name, modifiers), m_predicate(std::move(predicate))
    {
    }

  protected:
    std::expected<void, Error> ProcessEvent(const RelationEvent &) override { return {}; }

    std::expected<void, Error> OnOwnEvent(const RelationEvent &event) override
    {
      if (event.Type() == EventType::Remove)
        return {};
      if (!m_predicate)
        return std::unexpected(Error{ErrorCode::UnsupportedDerivation, "constraint without predicate", this->Name()});

      auto value = event.template ValueAs<T>();
      if (!value)
        return std::unexpected(value.error());
      if (!m_predicate(*value))
      {
        Logger().debug("constraint '{}' rejected {} value", this->Name(), ToString(event.Type()));
        return std::unexpected(Error{ErrorCode::ConstraintViolation, "value rejected by constraint", this->Name()});
      }
      return {};
    }

    [[nodiscard]] ListenerScope ScopeFor(const Relatable &) const noexcept override
    {
      return ListenerScope::Relations;
    }

  private:
    ValuePredicate m_predicate;
  };

  template <class T>
  ConstraintType<T> NewConstraint(std::string_view name, typename ConstraintType<T>::ValuePredicate predicate,
                                  Modifiers modifiers = {})
  {
    return ConstraintType<T>{name, std::move(predicate), modifiers};
  }

} // namespace NGIN::Relations
