// CounterType.hpp
// Reactive type counting the changes of its parent that match a predicate
#pragma once

#include <NGIN/Relations/AutomaticType.hpp>

#include <functional>
#include <utility>

namespace NGIN::Relations
{

  template <class N>
  class CounterType : public AutomaticType<N>
  {
  public:
    using EventPredicate = std::function<bool(const RelationEvent &)>;
    using IncrementFunction = std::function<N(N)>;

    CounterType(std::string_view name, N initialValue, EventPredicate predicate, IncrementFunction increment,
                Modifiers modifiers = {})
        : AutomaticType<N>(name, nullptr, [initialValue](Relatable &)
                           { return initialValue; }, modifiers),
          m_predicate(std::move(predicate)), m_increment(std::move(increment))
    {
    }

  protected:
    std::expected<void, Error> ProcessEvent(const RelationEvent &event) override
    {
      if (!m_predicate || !m_increment)
        return std::unexpected(Error{ErrorCode::UnsupportedDerivation, "counter without predicate or increment",
                                     this->Name()});
      if (!m_predicate(event))
        return {};
      auto counter = this->UpdatableOwnRelation(event);
      if (!counter)
        return std::unexpected(counter.error());
      if (!*counter)
        return {};
      return this->SetRelationTarget(**counter, m_increment((*counter)->GetTarget()));
    }

  private:
    EventPredicate m_predicate;
    IncrementFunction m_increment;
  };

  template <class N>
  CounterType<N> NewCounter(std::string_view name, N initialValue, typename CounterType<N>::EventPredicate predicate,
                            typename CounterType<N>::IncrementFunction increment, Modifiers modifiers = {})
  {
    return CounterType<N>{name, initialValue, std::move(predicate), std::move(increment), modifiers};
  }

  /// Integer counter starting at zero and incrementing by one.
  inline CounterType<int> NewIntCounter(std::string_view name, CounterType<int>::EventPredicate predicate,
                                        Modifiers modifiers = {})
  {
    return CounterType<int>{name, 0, std::move(predicate), [](int n)
                            { return n + 1; }, modifiers};
  }

} // namespace NGIN::Relations
