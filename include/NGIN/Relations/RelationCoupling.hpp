// RelationCoupling.hpp
// Couples relations to values held outside of the relation model
#pragma once

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/RelationType.hpp>
#include <NGIN/Relations/Collections.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <utility>

namespace NGIN::Relations
{

  /// Untyped part of a coupling. Couplings are stored on the relation they couple, in its
  /// CouplingTypes::Couplings annotation, and must not outlive the host of that relation.
  class NGIN_RELATIONS_API RelationCouplingBase
  {
  public:
    virtual ~RelationCouplingBase() = default;

    /// Sets the relation to the value of the source. Without a source this only reads it.
    virtual std::expected<void, Error> Query() = 0;
    /// Passes the value of the relation to the target, if there is one.
    virtual std::expected<void, Error> Update() = 0;
    /// Disables the coupling and takes it off its relation.
    virtual std::expected<void, Error> Remove() = 0;

    // Apply to every coupling of the relations of host accepted by filter.
    static std::expected<void, Error> GetAll(Relatable &host, const RelationFilter &filter = {});
    static std::expected<void, Error> SetAll(Relatable &host, const RelationFilter &filter = {});
    static std::expected<void, Error> RemoveAll(Relatable &host, const RelationFilter &filter = {});
  };

  using CouplingList = ListValue<std::shared_ptr<RelationCouplingBase>>;

  namespace CouplingTypes
  {
    NGIN_RELATIONS_API extern RelationType<CouplingList> Couplings;
  } // namespace CouplingTypes

  template <class T>
  class RelationCoupling final : public RelationCouplingBase
  {
  public:
    using UpdateTarget = std::function<std::expected<void, Error>(const T &)>;
    using QuerySource = std::function<std::expected<T, Error>()>;

    RelationCoupling(Relatable &host, RelationType<T> &type, UpdateTarget update, QuerySource query)
        : m_host(&host), m_type(&type), m_update(std::move(update)), m_query(std::move(query))
    {
    }

    /// Couples the relation of type on host, creating the relation if needed. At least one
    /// of update and query must be set.
    static std::expected<std::shared_ptr<RelationCoupling>, Error> Couple(Relatable &host, RelationType<T> &type,
                                                                         UpdateTarget update, QuerySource query)
    {
      if (!update && !query)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "coupling without functions", type.Name()});

      auto *relation = host.GetRelation(type);
      if (!relation)
      {
        auto value = host.Get(type);
        if (!value)
          return std::unexpected(value.error());
        relation = host.GetRelation(type);
        if (!relation)
        {
          auto added = host.Set(type, std::move(*value));
          if (!added)
            return std::unexpected(added.error());
          relation = *added;
        }
      }

      if (relation->IsImmutable())
        return std::unexpected(Error{ErrorCode::ImmutableViolation, "relation is immutable", type.Name()});
      auto couplings = relation->Get(CouplingTypes::Couplings);
      if (!couplings)
        return std::unexpected(couplings.error());
      auto coupling = std::make_shared<RelationCoupling>(host, type, std::move(update), std::move(query));
      if (auto ok = couplings->Add(coupling); !ok)
        return std::unexpected(ok.error());
      return coupling;
    }

    /// Couples to the relation of coupledType on coupledHost in both directions.
    static std::expected<std::shared_ptr<RelationCoupling>, Error> Couple(Relatable &host, RelationType<T> &type,
                                                                         Relatable &coupledHost,
                                                                         RelationType<T> &coupledType)
    {
      return Couple(
          host, type,
          [&coupledHost, &coupledType](const T &value) -> std::expected<void, Error>
          {
            auto set = coupledHost.Set(coupledType, value);
            if (!set)
              return std::unexpected(set.error());
            return {};
          },
          [&coupledHost, &coupledType]() -> std::expected<T, Error>
          { return coupledHost.Get(coupledType); });
    }

    static std::expected<std::shared_ptr<RelationCoupling>, Error> CoupleSource(Relatable &host,
                                                                               RelationType<T> &type,
                                                                               QuerySource query)
    {
      return Couple(host, type, nullptr, std::move(query));
    }

    static std::expected<std::shared_ptr<RelationCoupling>, Error> CoupleTarget(Relatable &host,
                                                                               RelationType<T> &type,
                                                                               UpdateTarget update)
    {
      return Couple(host, type, std::move(update), nullptr);
    }

    /// Value of the source stored in the relation, or the relation's value without a source.
    std::expected<T, Error> Get()
    {
      if (!m_query)
        return m_host->Get(*m_type);
      auto value = m_query();
      if (!value)
        return std::unexpected(value.error());
      auto relation = m_host->Set(*m_type, std::move(*value));
      if (!relation)
        return std::unexpected(relation.error());
      return (*relation)->GetTarget();
    }

    std::expected<void, Error> Set()
    {
      if (!m_update)
        return {};
      auto value = m_host->Get(*m_type);
      if (!value)
        return std::unexpected(value.error());
      return m_update(*value);
    }

    std::expected<void, Error> Query() override
    {
      auto value = Get();
      if (!value)
        return std::unexpected(value.error());
      return {};
    }

    std::expected<void, Error> Update() override { return Set(); }

    std::expected<void, Error> Remove() override
    {
      m_update = nullptr;
      m_query = nullptr;

      auto *relation = m_host->GetRelation(*m_type);
      if (!relation)
        return {};
      auto couplings = relation->GetOr(CouplingTypes::Couplings, CouplingList{});
      for (const auto &coupling : couplings)
      {
        if (coupling.get() != this)
          continue;
        // Keeps this coupling alive until Remove returns.
        const std::shared_ptr<RelationCouplingBase> self = coupling;
        auto removed = couplings.Remove(self);
        if (!removed)
          return std::unexpected(removed.error());
        return {};
      }
      return {};
    }

  private:
    Relatable *m_host;
    RelationType<T> *m_type;
    UpdateTarget m_update;
    QuerySource m_query;
  };

} // namespace NGIN::Relations
