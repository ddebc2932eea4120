// RelationTypes.hpp
// Factory functions for plain relation types
#pragma once

#include <NGIN/Relations/RelationType.hpp>
#include <NGIN/Relations/Collections.hpp>

#include <utility>

namespace NGIN::Relations
{

  template <class T>
  RelationType<T> NewType(std::string_view name, Modifiers modifiers = {})
  {
    return RelationType<T>{name, modifiers};
  }

  /// Type whose unset value is defaultValue; reading it never creates a relation.
  template <class T>
  RelationType<T> NewDefaultValueType(std::string_view name, T defaultValue, Modifiers modifiers = {})
  {
    return RelationType<T>{name, [value = std::move(defaultValue)](Relatable &)
                           { return value; }, nullptr, modifiers};
  }

  /// Type whose first read stores the result of initialValue on the object.
  template <class T>
  RelationType<T> NewInitialValueType(std::string_view name, typename RelationType<T>::ValueFunction initialValue,
                                      Modifiers modifiers = {})
  {
    return RelationType<T>{name, nullptr, std::move(initialValue), modifiers};
  }

  inline RelationType<bool> NewFlagType(std::string_view name, Modifiers modifiers = {})
  {
    return NewDefaultValueType<bool>(name, false, modifiers);
  }

  inline RelationType<int> NewIntType(std::string_view name, int defaultValue = 0, Modifiers modifiers = {})
  {
    return NewDefaultValueType<int>(name, defaultValue, modifiers);
  }

  template <class T>
  RelationType<ListValue<T>> NewListType(std::string_view name, Modifiers modifiers = {})
  {
    return RelationType<ListValue<T>>{name, modifiers};
  }

  template <class T>
  RelationType<SetValue<T>> NewSetType(std::string_view name, Modifiers modifiers = {})
  {
    return RelationType<SetValue<T>>{name, modifiers};
  }

  template <class K, class V>
  RelationType<MapValue<K, V>> NewMapType(std::string_view name, Modifiers modifiers = {})
  {
    return RelationType<MapValue<K, V>>{name, modifiers};
  }

} // namespace NGIN::Relations
