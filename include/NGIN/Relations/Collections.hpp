// Collections.hpp
// Shared-storage list, set and map values with read-only views
#pragma once

#include <NGIN/Relations/Types.hpp>

#include <algorithm>
#include <expected>
#include <initializer_list>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace NGIN::Relations
{

  namespace detail
  {
    struct CollectionAccess;

    inline constexpr std::string_view kReadOnlyCollection = "collection is read-only";
  } // namespace detail

  /// Copies share the same storage. A read-only view shares it too but rejects mutation;
  /// the stored elements themselves are not protected.
  template <class T>
  class ListValue
  {
  public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    ListValue() : m_items(std::make_shared<std::vector<T>>()) {}
    ListValue(std::initializer_list<T> items) : m_items(std::make_shared<std::vector<T>>(items)) {}

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_items->size(); }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_items->empty(); }
    [[nodiscard]] bool IsReadOnly() const noexcept { return m_readOnly; }
    [[nodiscard]] const T &operator[](NGIN::UIntSize i) const { return (*m_items)[i]; }
    [[nodiscard]] const_iterator begin() const noexcept { return m_items->cbegin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_items->cend(); }

    [[nodiscard]] bool Contains(const T &item) const
    {
      return std::find(m_items->begin(), m_items->end(), item) != m_items->end();
    }

    std::expected<void, Error> Add(T item)
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      m_items->push_back(std::move(item));
      return {};
    }

    /// Removes the first element equal to item; returns whether one was found.
    std::expected<bool, Error> Remove(const T &item)
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      auto it = std::find(m_items->begin(), m_items->end(), item);
      if (it == m_items->end())
        return false;
      m_items->erase(it);
      return true;
    }

    std::expected<void, Error> RemoveAt(NGIN::UIntSize index)
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      if (index >= m_items->size())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "index out of range"});
      m_items->erase(m_items->begin() + static_cast<std::ptrdiff_t>(index));
      return {};
    }

    std::expected<void, Error> Clear()
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      m_items->clear();
      return {};
    }

    [[nodiscard]] ListValue AsReadOnly() const
    {
      ListValue view(*this);
      view.m_readOnly = true;
      return view;
    }

    [[nodiscard]] std::vector<T> ToVector() const { return *m_items; }

    /// True if both handles share the same storage.
    [[nodiscard]] bool SharesStorage(const ListValue &other) const noexcept { return m_items == other.m_items; }

    bool operator==(const ListValue &other) const { return *m_items == *other.m_items; }

  private:
    friend struct detail::CollectionAccess;

    std::shared_ptr<std::vector<T>> m_items;
    bool m_readOnly{false};
  };

  /// Insertion-ordered set of distinct elements (compared with ==).
  template <class T>
  class SetValue
  {
  public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    SetValue() : m_items(std::make_shared<std::vector<T>>()) {}
    SetValue(std::initializer_list<T> items) : SetValue()
    {
      for (const auto &item : items)
        Insert(item);
    }

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_items->size(); }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_items->empty(); }
    [[nodiscard]] bool IsReadOnly() const noexcept { return m_readOnly; }
    [[nodiscard]] const_iterator begin() const noexcept { return m_items->cbegin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_items->cend(); }

    [[nodiscard]] bool Contains(const T &item) const
    {
      return std::find(m_items->begin(), m_items->end(), item) != m_items->end();
    }

    /// Returns false if the element was already present.
    std::expected<bool, Error> Add(T item)
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      return Insert(std::move(item));
    }

    std::expected<bool, Error> Remove(const T &item)
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      auto it = std::find(m_items->begin(), m_items->end(), item);
      if (it == m_items->end())
        return false;
      m_items->erase(it);
      return true;
    }

    std::expected<void, Error> Clear()
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      m_items->clear();
      return {};
    }

    [[nodiscard]] SetValue AsReadOnly() const
    {
      SetValue view(*this);
      view.m_readOnly = true;
      return view;
    }

    [[nodiscard]] std::vector<T> ToVector() const { return *m_items; }
    [[nodiscard]] bool SharesStorage(const SetValue &other) const noexcept { return m_items == other.m_items; }

    // Order-sensitive, like the iteration order.
    bool operator==(const SetValue &other) const { return *m_items == *other.m_items; }

  private:
    friend struct detail::CollectionAccess;

    bool Insert(T item)
    {
      if (Contains(item))
        return false;
      m_items->push_back(std::move(item));
      return true;
    }

    std::shared_ptr<std::vector<T>> m_items;
    bool m_readOnly{false};
  };

  /// Insertion-ordered key/value map.
  template <class K, class V>
  class MapValue
  {
  public:
    using key_type = K;
    using mapped_type = V;
    using Entry = std::pair<K, V>;
    using const_iterator = typename std::vector<Entry>::const_iterator;

    MapValue() : m_entries(std::make_shared<std::vector<Entry>>()) {}

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_entries->size(); }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_entries->empty(); }
    [[nodiscard]] bool IsReadOnly() const noexcept { return m_readOnly; }
    [[nodiscard]] const_iterator begin() const noexcept { return m_entries->cbegin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_entries->cend(); }

    [[nodiscard]] bool ContainsKey(const K &key) const { return Find(key) != m_entries->end(); }

    [[nodiscard]] std::optional<V> Get(const K &key) const
    {
      auto it = Find(key);
      if (it == m_entries->end())
        return std::nullopt;
      return it->second;
    }

    std::expected<void, Error> Put(K key, V value)
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      auto it = Find(key);
      if (it != m_entries->end())
        it->second = std::move(value);
      else
        m_entries->emplace_back(std::move(key), std::move(value));
      return {};
    }

    std::expected<bool, Error> Remove(const K &key)
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      auto it = Find(key);
      if (it == m_entries->end())
        return false;
      m_entries->erase(it);
      return true;
    }

    std::expected<void, Error> Clear()
    {
      if (m_readOnly)
        return std::unexpected(Error{ErrorCode::ImmutableViolation, detail::kReadOnlyCollection});
      m_entries->clear();
      return {};
    }

    [[nodiscard]] MapValue AsReadOnly() const
    {
      MapValue view(*this);
      view.m_readOnly = true;
      return view;
    }

    [[nodiscard]] std::vector<K> Keys() const
    {
      std::vector<K> keys;
      keys.reserve(m_entries->size());
      for (const auto &e : *m_entries)
        keys.push_back(e.first);
      return keys;
    }

    [[nodiscard]] bool SharesStorage(const MapValue &other) const noexcept { return m_entries == other.m_entries; }

    bool operator==(const MapValue &other) const { return *m_entries == *other.m_entries; }

  private:
    friend struct detail::CollectionAccess;

    typename std::vector<Entry>::iterator Find(const K &key) const
    {
      return std::find_if(m_entries->begin(), m_entries->end(), [&](const Entry &e)
                          { return e.first == key; });
    }

    std::shared_ptr<std::vector<Entry>> m_entries;
    bool m_readOnly{false};
  };

  namespace detail
  {
    template <class T>
    struct IsCollectionValueT : std::false_type
    {
    };
    template <class T>
    struct IsCollectionValueT<ListValue<T>> : std::true_type
    {
    };
    template <class T>
    struct IsCollectionValueT<SetValue<T>> : std::true_type
    {
    };
    template <class K, class V>
    struct IsCollectionValueT<MapValue<K, V>> : std::true_type
    {
    };

    template <class T>
    inline constexpr bool IsCollectionValue = IsCollectionValueT<T>::value;

    // Framework-internal writers (collectors) mutate through protected views.
    struct CollectionAccess
    {
      template <class C>
      static C Writable(const C &collection)
      {
        C writable(collection);
        writable.m_readOnly = false;
        return writable;
      }
    };
  } // namespace detail

} // namespace NGIN::Relations
