#include <NGIN/Relations/RelationEvent.hpp>
#include <NGIN/Relations/RelationType.hpp>

namespace NGIN::Relations
{

  RelationTypeBase &RelationEvent::ElementType() const noexcept
  {
    return m_element->Type();
  }

  Any RelationEvent::Value() const
  {
    if (m_type == EventType::Update && m_updateValue)
      return *m_updateValue;
    return m_element->GetAnyTarget();
  }

  std::expected<void, Error> EventDispatcher::Add(RelationListener &listener)
  {
    if (m_frozen)
      return std::unexpected(Error{ErrorCode::ImmutableViolation, "listeners are frozen"});
    m_listeners.PushBack(&listener);
    return {};
  }

  std::expected<void, Error> EventDispatcher::Remove(RelationListener &listener)
  {
    if (m_frozen)
      return std::unexpected(Error{ErrorCode::ImmutableViolation, "listeners are frozen"});
    bool removed = false;
    detail::EraseIf(m_listeners, [&](RelationListener *registered)
                    {
                      if (removed || registered != &listener)
                        return false;
                      removed = true;
                      return true; });
    if (!removed)
      return std::unexpected(Error{ErrorCode::NotFound, "listener not registered"});
    return {};
  }

  bool EventDispatcher::Contains(const RelationListener &listener) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_listeners.Size(); ++i)
    {
      if (m_listeners[i] == &listener)
        return true;
    }
    return false;
  }

  std::expected<void, Error> EventDispatcher::Dispatch(const RelationEvent &event) const
  {
    NGIN::Containers::Vector<RelationListener *> snapshot;
    snapshot.Reserve(m_listeners.Size());
    for (NGIN::UIntSize i = 0; i < m_listeners.Size(); ++i)
      snapshot.PushBack(m_listeners[i]);
    for (NGIN::UIntSize i = 0; i < snapshot.Size(); ++i)
    {
      if (auto ok = snapshot[i]->HandleEvent(event); !ok)
        return ok;
    }
    return {};
  }

} // namespace NGIN::Relations
