#include <NGIN/Relations/Relation.hpp>
#include <NGIN/Relations/RelationType.hpp>
#include <NGIN/Relations/Logging.hpp>

#include <utility>

namespace NGIN::Relations
{

  RelationBase::~RelationBase() = default;

  bool RelationBase::HasAnnotation(const RelationTypeBase &annotation) const noexcept
  {
    return HasRelation(annotation) || Type().HasRelation(annotation);
  }

  bool RelationBase::HasFlagAnnotation(const RelationType<bool> &flag) const noexcept
  {
    if (auto *own = GetRelation(flag))
      return own->GetTarget();
    return Type().HasFlag(flag);
  }

  void RelationBase::LinkAlias(Relatable &parent, RelationBase &alias)
  {
    m_aliases.PushBack(AliasLink{&parent, &alias});
  }

  void RelationBase::UnlinkAlias(const RelationBase &alias)
  {
    detail::EraseIf(m_aliases, [&alias](const AliasLink &link)
                    { return link.alias == &alias; });
  }

  void RelationBase::ReleaseAliases()
  {
    NGIN::Containers::Vector<AliasLink> aliases{std::move(m_aliases)};
    m_aliases = NGIN::Containers::Vector<AliasLink>{};
    for (NGIN::UIntSize i = 0; i < aliases.Size(); ++i)
      aliases[i].alias->ReleaseWrapped();
  }

  std::expected<void, Error> RelationBase::Removed()
  {
    NGIN::Containers::Vector<AliasLink> aliases{std::move(m_aliases)};
    m_aliases = NGIN::Containers::Vector<AliasLink>{};

    std::expected<void, Error> result{};
    for (NGIN::UIntSize i = 0; i < aliases.Size(); ++i)
    {
      auto &link = aliases[i];
      link.alias->ReleaseWrapped();
      auto &aliasType = link.alias->Type();
      if (link.parent->GetRelation(aliasType) != link.alias)
        continue;
      if (auto ok = link.parent->DeleteRelation(aliasType); !ok)
      {
        Logger().warn("alias '{}' of deleted relation '{}' stays detached: {}", aliasType.Name(), Type().Name(),
                      ok.error().message);
        if (result)
          result = std::unexpected(ok.error());
      }
    }
    return result;
  }

} // namespace NGIN::Relations
