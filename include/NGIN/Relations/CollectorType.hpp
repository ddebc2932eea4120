// CollectorType.hpp
// Reactive type collecting values derived from the changes of its parent
#pragma once

#include <NGIN/Relations/AutomaticType.hpp>
#include <NGIN/Relations/Collections.hpp>
#include <NGIN/Relations/StandardTypes.hpp>

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace NGIN::Relations
{

  /// Collects the non-empty results of a function applied to each changed relation and its
  /// new value. With a SetValue collection values are distinct and a REMOVE takes the
  /// collected value out again; lists ignore removals. A Maximum annotation on the relation
  /// (or the type) limits the size by dropping the oldest values.
  template <class T, template <class> class C>
  class BasicCollectorType : public AutomaticType<C<T>>
  {
  public:
    using Collection = C<T>;
    using CollectFunction = std::function<std::optional<T>(const RelationBase &, const Any &)>;

    static constexpr bool IsDistinct = std::is_same_v<Collection, SetValue<T>>;

    BasicCollectorType(std::string_view name, CollectFunction collect, Modifiers modifiers = {})
        : AutomaticType<Collection>(name, modifiers), m_collect(std::move(collect))
    {
    }

  protected:
    std::expected<void, Error> ProcessEvent(const RelationEvent &event) override
    {
      if (!m_collect)
        return std::unexpected(Error{ErrorCode::UnsupportedDerivation, "collector without collect function",
                                     this->Name()});
      const auto type = event.Type();
      if (type == EventType::Remove && !IsDistinct)
        return {};

      if (!this->OwnRelation(event))
        return {};

      auto value = m_collect(event.Element(), event.Value());
      if (!value)
        return {};

      auto updatable = this->UpdatableOwnRelation(event);
      if (!updatable)
        return std::unexpected(updatable.error());
      auto *own = *updatable;
      if (!own)
        return {};

      auto values = detail::CollectionAccess::Writable(own->GetTarget());
      if (type == EventType::Remove)
      {
        if (auto removed = values.Remove(*value); !removed)
          return std::unexpected(removed.error());
        return {};
      }

      if (auto added = values.Add(std::move(*value)); !added)
        return std::unexpected(added.error());
      return Trim(*own, values);
    }

  private:
    std::expected<void, Error> Trim(const Relation<Collection> &own, Collection &values) const
    {
      const auto maximum = own.GetAnnotation(StandardTypes::Maximum);
      if (!maximum || *maximum < 0)
        return {};
      while (values.Size() > static_cast<NGIN::UIntSize>(*maximum))
      {
        const T oldest = *values.begin();
        if (auto removed = values.Remove(oldest); !removed)
          return std::unexpected(removed.error());
      }
      return {};
    }

    CollectFunction m_collect;
  };

  template <class T>
  using CollectorType = BasicCollectorType<T, ListValue>;

  template <class T>
  using DistinctCollectorType = BasicCollectorType<T, SetValue>;

  template <class T>
  CollectorType<T> NewCollector(std::string_view name, typename CollectorType<T>::CollectFunction collect,
                                Modifiers modifiers = {})
  {
    return CollectorType<T>{name, std::move(collect), modifiers};
  }

  template <class T>
  DistinctCollectorType<T> NewDistinctCollector(std::string_view name,
                                                typename DistinctCollectorType<T>::CollectFunction collect,
                                                Modifiers modifiers = {})
  {
    return DistinctCollectorType<T>{name, std::move(collect), modifiers};
  }

} // namespace NGIN::Relations
