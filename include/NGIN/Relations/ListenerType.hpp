// ListenerType.hpp
// Relation type whose value is a list of listeners notified of the parent's changes
#pragma once

#include <NGIN/Relations/AutomaticType.hpp>
#include <NGIN/Relations/Collections.hpp>

#include <functional>
#include <utility>

namespace NGIN::Relations
{

  template <class L>
  class ListenerType : public AutomaticType<ListValue<L>>
  {
  public:
    using DispatchFunction = std::function<std::expected<void, Error>(const L &, const RelationEvent &)>;

    ListenerType(std::string_view name, DispatchFunction dispatch, Modifiers modifiers = {})
        : AutomaticType<ListValue<L>>(name, modifiers), m_dispatch(std::move(dispatch))
    {
    }

    /// Forwards event to the listeners registered on source through the dispatch function.
    std::expected<void, Error> NotifyListeners(Relatable &source, const RelationEvent &event) const
    {
      if (!m_dispatch)
        return std::unexpected(Error{ErrorCode::UnsupportedDerivation, "listener type without dispatch function",
                                     this->Name()});
      return NotifyListeners(source, event, m_dispatch);
    }

    /// Notifies the listeners registered on source with an arbitrary event object.
    /// handler(const L&, const E&) returns std::expected<void, Error>; the first error stops
    /// the notification.
    template <class E, class Handler>
    std::expected<void, Error> NotifyListeners(Relatable &source, const E &event, Handler &&handler) const
    {
      auto *relation = source.GetRelation(*this);
      if (!relation)
        return {};
      const auto listeners = relation->GetTarget().ToVector();
      for (const auto &listener : listeners)
      {
        if (auto ok = handler(listener, event); !ok)
          return ok;
      }
      return {};
    }

  protected:
    std::expected<void, Error> ProcessEvent(const RelationEvent &event) override
    {
      return NotifyListeners(event.EventScope(), event);
    }

  private:
    DispatchFunction m_dispatch;
  };

  template <class L>
  ListenerType<L> NewListenerType(std::string_view name, typename ListenerType<L>::DispatchFunction dispatch,
                                  Modifiers modifiers = {})
  {
    return ListenerType<L>{name, std::move(dispatch), modifiers};
  }

} // namespace NGIN::Relations
