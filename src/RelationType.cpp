#include <NGIN/Relations/RelationType.hpp>
#include <NGIN/Relations/Logging.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

namespace NGIN::Relations::detail
{

  using StringInterner = NGIN::Utilities::StringInterner<>;
  using NameId = StringInterner::IdType;

  struct TypeRegistry
  {
    StringInterner names;
    // Entries of unregistered types are reset to nullptr.
    NGIN::Containers::FlatHashMap<NameId, RelationTypeBase *> byName;
    NGIN::Containers::Vector<RelationTypeBase *> types;
  };

  // Function-local so descriptors defined as globals in other translation units can register.
  TypeRegistry &GetTypeRegistry() noexcept
  {
    static TypeRegistry s_registry{};
    return s_registry;
  }

  namespace
  {
    constexpr bool IsIdentStart(char c) noexcept
    {
      return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_' || c == '$';
    }

    constexpr bool IsIdentPart(char c) noexcept
    {
      return IsIdentStart(c) || (c >= '0' && c <= '9');
    }
  } // namespace

  // ident(.ident)*
  bool IsValidRelationTypeName(std::string_view name) noexcept
  {
    if (name.empty())
      return false;
    bool atStart = true;
    for (char c : name)
    {
      if (atStart)
      {
        if (!IsIdentStart(c))
          return false;
        atStart = false;
      }
      else if (c == '.')
      {
        atStart = true;
      }
      else if (!IsIdentPart(c))
      {
        return false;
      }
    }
    return !atStart;
  }

} // namespace NGIN::Relations::detail

namespace NGIN::Relations
{

  using detail::GetTypeRegistry;

  RelationTypeBase::RelationTypeBase(std::string_view name, NGIN::UInt64 valueTypeId, std::string_view valueTypeName,
                                     Modifiers modifiers)
      : m_valueTypeId(valueTypeId), m_valueTypeName(valueTypeName), m_modifiers(modifiers)
  {
    auto &reg = GetTypeRegistry();
    m_name = reg.names.Intern(name);

    if (!detail::IsValidRelationTypeName(name))
    {
      Logger().error("invalid relation type name '{}'", name);
      return;
    }

    const auto id = reg.names.InsertOrGet(name);
    if (id == detail::StringInterner::INVALID_ID)
    {
      Logger().error("cannot intern relation type name '{}'", name);
      return;
    }

    if (auto *slot = reg.byName.GetPtr(id))
    {
      if (*slot)
      {
        Logger().error("duplicate relation type name '{}'", name);
        return;
      }
      *slot = this;
    }
    else
    {
      reg.byName.Insert(id, this);
    }
    reg.types.PushBack(this);
    m_registered = true;
    Logger().trace("registered relation type '{}' ({})", m_name, m_valueTypeName);
  }

  RelationTypeBase::~RelationTypeBase()
  {
    if (!m_registered)
      return;
    auto &reg = GetTypeRegistry();
    detail::NameId id{};
    if (reg.names.TryGetId(m_name, id))
    {
      if (auto *slot = reg.byName.GetPtr(id); slot && *slot == this)
        *slot = nullptr;
    }
    detail::EraseIf(reg.types, [this](RelationTypeBase *type)
                    { return type == this; });
  }

  std::string_view RelationTypeBase::Namespace() const noexcept
  {
    const auto pos = m_name.rfind('.');
    if (pos == std::string_view::npos)
      return {};
    return m_name.substr(0, pos);
  }

  std::string_view RelationTypeBase::SimpleName() const noexcept
  {
    const auto pos = m_name.rfind('.');
    if (pos == std::string_view::npos)
      return m_name;
    return m_name.substr(pos + 1);
  }

  RelationTypeBase *RelationTypeBase::ValueOf(std::string_view name) noexcept
  {
    auto &reg = GetTypeRegistry();
    detail::NameId id{};
    if (!reg.names.TryGetId(name, id))
      return nullptr;
    if (auto *slot = reg.byName.GetPtr(id))
      return *slot;
    return nullptr;
  }

  NGIN::Containers::Vector<RelationTypeBase *> RelationTypeBase::GetRegisteredRelationTypes()
  {
    const auto &reg = GetTypeRegistry();
    NGIN::Containers::Vector<RelationTypeBase *> out;
    out.Reserve(reg.types.Size());
    for (NGIN::UIntSize i = 0; i < reg.types.Size(); ++i)
      out.PushBack(reg.types[i]);
    return out;
  }

  NGIN::Containers::Vector<RelationTypeBase *> RelationTypeBase::GetRelationTypes(
      const std::function<bool(const RelationTypeBase &)> &filter)
  {
    const auto &reg = GetTypeRegistry();
    NGIN::Containers::Vector<RelationTypeBase *> out;
    for (NGIN::UIntSize i = 0; i < reg.types.Size(); ++i)
    {
      auto *type = reg.types[i];
      if (!filter || filter(*type))
        out.PushBack(type);
    }
    return out;
  }

  std::expected<void, Error> RelationTypeBase::AttachRelation(Relatable &, RelationBase &)
  {
    return {};
  }

  std::expected<void, Error> RelationTypeBase::DetachRelation(Relatable &, RelationBase &)
  {
    return {};
  }

} // namespace NGIN::Relations
