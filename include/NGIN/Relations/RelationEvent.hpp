// RelationEvent.hpp
// Change events raised by hosts and the ordered listener lists they are dispatched to
#pragma once

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/Types.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <expected>

namespace NGIN::Relations
{

  class Relatable;
  class RelationBase;
  class RelationTypeBase;

  /// Transient record of one ADD/UPDATE/REMOVE on a relation.
  ///
  /// Source() is the host whose relation changed. EventScope() is the object the
  /// listener list belongs to: the host itself, the changed relation, or its type.
  class NGIN_RELATIONS_API RelationEvent
  {
  public:
    RelationEvent(EventType type, Relatable &source, RelationBase &element,
                  const Any *updateValue, Relatable &eventScope) noexcept
        : m_type(type), m_source(&source), m_element(&element), m_updateValue(updateValue), m_scope(&eventScope)
    {
    }

    [[nodiscard]] EventType Type() const noexcept { return m_type; }
    [[nodiscard]] Relatable &Source() const noexcept { return *m_source; }
    [[nodiscard]] RelationBase &Element() const noexcept { return *m_element; }
    [[nodiscard]] Relatable &EventScope() const noexcept { return *m_scope; }

    /// Proposed value for UPDATE events, nullptr otherwise.
    [[nodiscard]] const Any *UpdateValue() const noexcept { return m_updateValue; }

    [[nodiscard]] RelationTypeBase &ElementType() const noexcept;

    /// Update value for UPDATE, the element's current value otherwise.
    [[nodiscard]] Any Value() const;

    /// Typed variant of Value(); TypeMismatch if T is not the element's value type.
    template <class T>
    [[nodiscard]] std::expected<T, Error> ValueAs() const
    {
      Any v = Value();
      if (v.GetTypeId() != detail::TypeIdOf<T>())
        return std::unexpected(Error{ErrorCode::TypeMismatch, "event value type mismatch"});
      return v.template Cast<T>();
    }

    [[nodiscard]] RelationEvent WithScope(Relatable &scope) const noexcept
    {
      return RelationEvent{m_type, *m_source, *m_element, m_updateValue, scope};
    }

  private:
    EventType m_type;
    Relatable *m_source;
    RelationBase *m_element;
    const Any *m_updateValue;
    Relatable *m_scope;
  };

  class NGIN_RELATIONS_API RelationListener
  {
  public:
    virtual ~RelationListener() = default;

    /// Returning an error aborts the remaining dispatch and the originating mutation.
    virtual std::expected<void, Error> HandleEvent(const RelationEvent &event) = 0;
  };

  /// Ordered, non-owning listener list. Once frozen the list can no longer change.
  class NGIN_RELATIONS_API EventDispatcher
  {
  public:
    std::expected<void, Error> Add(RelationListener &listener);
    std::expected<void, Error> Remove(RelationListener &listener);

    [[nodiscard]] bool Contains(const RelationListener &listener) const noexcept;
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_listeners.Size(); }
    [[nodiscard]] bool IsFrozen() const noexcept { return m_frozen; }

    void Freeze() noexcept { m_frozen = true; }

    // Iterates a snapshot so listeners may add or remove listeners while handling.
    std::expected<void, Error> Dispatch(const RelationEvent &event) const;

  private:
    NGIN::Containers::Vector<RelationListener *> m_listeners;
    bool m_frozen{false};
  };

} // namespace NGIN::Relations
