// Types.hpp
// Public-facing error codes, modifiers and small enums shared by hosts, relations and events
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <initializer_list>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Relations
{

  using Any = NGIN::Utilities::Any<>;

  enum class ErrorCode : unsigned
  {
    TypeMismatch = 1,
    IllegalMutation = 2,
    ConstraintViolation = 3,
    ImmutableViolation = 4,
    UnsupportedDerivation = 5,
    NotFound = 6,
    InvalidArgument = 7,
    DuplicateName = 8,
  };

  [[nodiscard]] constexpr std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
    case ErrorCode::TypeMismatch:
      return "TypeMismatch";
    case ErrorCode::IllegalMutation:
      return "IllegalMutation";
    case ErrorCode::ConstraintViolation:
      return "ConstraintViolation";
    case ErrorCode::ImmutableViolation:
      return "ImmutableViolation";
    case ErrorCode::UnsupportedDerivation:
      return "UnsupportedDerivation";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::DuplicateName:
      return "DuplicateName";
    }
    return "Unknown";
  }

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    // Name of the relation type the failed operation was applied to (may be empty)
    std::string_view relation{};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    constexpr Error(ErrorCode c, std::string_view m, std::string_view r) : code(c), message(m), relation(r) {}
  };

  enum class Modifier : NGIN::UInt8
  {
    Final = 1u << 0,     // write-once
    ReadOnly = 1u << 1,  // only the framework may set the value
    Private = 1u << 2,   // hidden from enumeration, raises no events
    Transient = 1u << 3, // excluded from persistence (flag only)
  };

  class Modifiers
  {
  public:
    constexpr Modifiers() noexcept = default;
    constexpr Modifiers(Modifier m) noexcept : m_bits(static_cast<NGIN::UInt8>(m)) {}
    constexpr Modifiers(std::initializer_list<Modifier> list) noexcept
    {
      for (auto m : list)
        m_bits = static_cast<NGIN::UInt8>(m_bits | static_cast<NGIN::UInt8>(m));
    }

    [[nodiscard]] constexpr bool Has(Modifier m) const noexcept
    {
      return (m_bits & static_cast<NGIN::UInt8>(m)) != 0;
    }
    [[nodiscard]] constexpr bool IsEmpty() const noexcept { return m_bits == 0; }
    [[nodiscard]] constexpr NGIN::UInt8 Bits() const noexcept { return m_bits; }

    constexpr Modifiers operator|(Modifiers other) const noexcept
    {
      Modifiers r;
      r.m_bits = static_cast<NGIN::UInt8>(m_bits | other.m_bits);
      return r;
    }

    constexpr bool operator==(const Modifiers &) const noexcept = default;

  private:
    NGIN::UInt8 m_bits{0};
  };

  constexpr Modifiers operator|(Modifier a, Modifier b) noexcept
  {
    return Modifiers{a} | Modifiers{b};
  }

  enum class EventType : NGIN::UInt8
  {
    Add = 0,
    Update = 1,
    Remove = 2,
  };

  [[nodiscard]] constexpr std::string_view ToString(EventType type) noexcept
  {
    switch (type)
    {
    case EventType::Add:
      return "ADD";
    case EventType::Update:
      return "UPDATE";
    case EventType::Remove:
      return "REMOVE";
    }
    return "UNKNOWN";
  }

  // What a Relatable actually is; selects the listener scope automatic types register in.
  enum class HostKind : NGIN::UInt8
  {
    Object = 0,
    RelationType = 1,
    Relation = 2,
  };

  enum class ListenerScope : NGIN::UInt8
  {
    Relations = 0,       // changes of the host's own relations
    RelationType = 1,    // changes of relations of this type on any host
    RelationUpdates = 2, // changes of this relation's value on its parent
  };

  inline constexpr NGIN::UIntSize ListenerScopeCount = 3;

  [[nodiscard]] constexpr ListenerScope ScopeForHost(HostKind kind) noexcept
  {
    switch (kind)
    {
    case HostKind::RelationType:
      return ListenerScope::RelationType;
    case HostKind::Relation:
      return ListenerScope::RelationUpdates;
    case HostKind::Object:
      break;
    }
    return ListenerScope::Relations;
  }

  namespace detail
  {
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    template <class T>
    inline std::string_view TypeNameOf() noexcept
    {
      return NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
    }

    // Removes the elements matching pred and keeps the order of the rest. Returns the number removed.
    template <class T, class Pred>
    NGIN::UIntSize EraseIf(NGIN::Containers::Vector<T> &values, Pred pred)
    {
      NGIN::Containers::Vector<T> kept;
      kept.Reserve(values.Size());
      NGIN::UIntSize removed = 0;
      for (NGIN::UIntSize i = 0; i < values.Size(); ++i)
      {
        if (pred(values[i]))
        {
          ++removed;
          continue;
        }
        kept.PushBack(std::move(values[i]));
      }
      values = std::move(kept);
      return removed;
    }
  } // namespace detail

} // namespace NGIN::Relations
