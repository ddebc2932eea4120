#include <NGIN/Relations/Relatable.hpp>
#include <NGIN/Relations/RelationType.hpp>
#include <NGIN/Relations/Logging.hpp>

#include <cstdint>
#include <utility>

namespace NGIN::Relations
{

  namespace
  {
    NGIN::UInt64 KeyOf(const RelationTypeBase &type) noexcept
    {
      return static_cast<NGIN::UInt64>(reinterpret_cast<std::uintptr_t>(&type));
    }

    constexpr std::string_view kHostImmutable = "object is immutable";

    struct DispatchState
    {
      NGIN::UIntSize depth{0};
      NGIN::Containers::Vector<std::unique_ptr<RelationBase>> retired;
    };

    DispatchState &CurrentDispatch() noexcept
    {
      thread_local DispatchState s_state{};
      return s_state;
    }
  } // namespace

  Relatable::Relatable() noexcept = default;
  Relatable::~Relatable() = default;

  RelationBase *Relatable::FindRelation(const RelationTypeBase &type) const noexcept
  {
    if (auto *p = m_index.GetPtr(KeyOf(type)))
      return *p;
    return nullptr;
  }

  RelationBase *Relatable::GetRelation(const RelationTypeBase &type) const noexcept
  {
    return FindRelation(type);
  }

  bool Relatable::HasRelation(const RelationTypeBase &type) const noexcept
  {
    return FindRelation(type) != nullptr;
  }

  bool Relatable::HasRelations() const noexcept
  {
    return RelationCount() != 0;
  }

  NGIN::Containers::Vector<RelationBase *> Relatable::GetRelations(const RelationFilter &filter) const
  {
    NGIN::Containers::Vector<RelationBase *> out;
    out.Reserve(m_relations.Size());
    for (NGIN::UIntSize i = 0; i < m_relations.Size(); ++i)
    {
      auto *relation = m_relations[i].get();
      if (relation->Type().IsPrivate())
        continue;
      if (filter && !filter(*relation))
        continue;
      out.PushBack(relation);
    }
    return out;
  }

  NGIN::UIntSize Relatable::RelationCount() const noexcept
  {
    NGIN::UIntSize count = 0;
    for (NGIN::UIntSize i = 0; i < m_relations.Size(); ++i)
    {
      if (!m_relations[i]->Type().IsPrivate())
        ++count;
    }
    return count;
  }

  bool Relatable::HasFlag(const RelationType<bool> &flag) const noexcept
  {
    auto *relation = GetRelation(flag);
    return relation && relation->GetTarget();
  }

  std::expected<Relation<bool> *, Error> Relatable::SetFlag(RelationType<bool> &flag)
  {
    return Set(flag, true);
  }

  std::expected<void, Error> Relatable::Init(RelationTypeBase &type)
  {
    return type.InitOn(*this);
  }

  std::expected<Any, Error> Relatable::GetAny(RelationTypeBase &type)
  {
    return type.GetAnyFrom(*this);
  }

  std::expected<RelationBase *, Error> Relatable::SetAny(RelationTypeBase &type, const Any &value)
  {
    return type.SetAnyOn(*this, value);
  }

  std::expected<void, Error> Relatable::CheckHostMutable(const RelationTypeBase &type) const
  {
    if (m_immutable)
    {
      Logger().debug("rejected change of '{}' on immutable object", type.Name());
      return std::unexpected(Error{ErrorCode::ImmutableViolation, kHostImmutable, type.Name()});
    }
    return {};
  }

  std::expected<void, Error> Relatable::CheckUpdateAllowed(const RelationBase &relation) const
  {
    const auto &type = relation.Type();
    if (relation.IsImmutable())
    {
      Logger().debug("rejected change of immutable relation '{}'", type.Name());
      return std::unexpected(Error{ErrorCode::ImmutableViolation, "relation is immutable", type.Name()});
    }
    if (type.IsFinal())
      return std::unexpected(Error{ErrorCode::IllegalMutation, "relation type is final", type.Name()});
    if (type.IsReadOnly())
      return std::unexpected(Error{ErrorCode::IllegalMutation, "relation type is read-only", type.Name()});
    return {};
  }

  std::expected<RelationBase *, Error> Relatable::AddNewRelation(std::unique_ptr<RelationBase> relation)
  {
    auto &type = relation->Type();
    if (auto ok = CheckHostMutable(type); !ok)
      return std::unexpected(ok.error());

    if (auto ok = type.AttachRelation(*this, *relation); !ok)
      return std::unexpected(ok.error());

    if (auto ok = NotifyRelationListeners(EventType::Add, *relation, nullptr); !ok)
    {
      // Undo the attachment and report the dispatch error.
      if (auto undo = type.DetachRelation(*this, *relation); !undo)
        Logger().error("failed to detach '{}' after rejected addition: {}", type.Name(), undo.error().message);
      return std::unexpected(ok.error());
    }

    if (FindRelation(type))
    {
      if (auto undo = type.DetachRelation(*this, *relation); !undo)
        Logger().error("failed to detach '{}' after concurrent addition: {}", type.Name(), undo.error().message);
      return std::unexpected(Error{ErrorCode::IllegalMutation, "relation added during dispatch", type.Name()});
    }

    auto *raw = relation.get();
    const auto key = KeyOf(type);
    if (auto *slot = m_index.GetPtr(key))
      *slot = raw;
    else
      m_index.Insert(key, raw);
    m_relations.PushBack(std::move(relation));
    return raw;
  }

  std::expected<void, Error> Relatable::DeleteRelation(RelationTypeBase &type)
  {
    if (auto ok = CheckHostMutable(type); !ok)
      return std::unexpected(ok.error());

    auto *relation = FindRelation(type);
    if (!relation)
      return {};

    if (relation->IsImmutable())
    {
      Logger().debug("rejected deletion of immutable relation '{}'", type.Name());
      return std::unexpected(Error{ErrorCode::ImmutableViolation, "relation is immutable", type.Name()});
    }
    if (type.IsFinal() || type.IsReadOnly())
      return std::unexpected(Error{ErrorCode::IllegalMutation, "final or read-only relation cannot be deleted", type.Name()});

    if (auto ok = type.DetachRelation(*this, *relation); !ok)
      return std::unexpected(ok.error());

    const DispatchGuard guard;
    std::unique_ptr<RelationBase> removed;
    detail::EraseIf(m_relations, [&](std::unique_ptr<RelationBase> &r)
                    {
                      if (r.get() != relation)
                        return false;
                      removed = std::move(r);
                      return true; });
    if (auto *slot = m_index.GetPtr(KeyOf(type)))
      *slot = nullptr;
    RetireRelation(std::move(removed));

    // Listeners see the relation after it left the host.
    auto notified = NotifyRelationListeners(EventType::Remove, *relation, nullptr);
    auto released = relation->Removed();
    if (!notified)
      return notified;
    return released;
  }

  std::expected<void, Error> Relatable::DeleteRelations(const RelationFilter &filter)
  {
    const DispatchGuard guard;
    auto relations = GetRelations(filter);
    for (NGIN::UIntSize i = 0; i < relations.Size(); ++i)
    {
      if (auto ok = DeleteRelation(relations[i]->Type()); !ok)
        return ok;
    }
    return {};
  }

  void Relatable::BeginDispatch() noexcept
  {
    ++CurrentDispatch().depth;
  }

  void Relatable::EndDispatch()
  {
    auto &state = CurrentDispatch();
    if (--state.depth != 0 || state.retired.Size() == 0)
      return;
    NGIN::Containers::Vector<std::unique_ptr<RelationBase>> retired{std::move(state.retired)};
    state.retired = NGIN::Containers::Vector<std::unique_ptr<RelationBase>>{};
  }

  void Relatable::RetireRelation(std::unique_ptr<RelationBase> relation)
  {
    CurrentDispatch().retired.PushBack(std::move(relation));
  }

  std::expected<void, Error> Relatable::NotifyRelationListeners(EventType type, RelationBase &relation,
                                                                const Any *updateValue)
  {
    auto &relationType = relation.Type();
    if (relationType.IsPrivate())
      return {};

    const RelationEvent event{type, *this, relation, updateValue, *this};

    const DispatchGuard guard;
    // An UPDATE stops once a listener removed the relation from this host.
    const auto stillBound = [&]() -> std::expected<void, Error>
    {
      if (type == EventType::Update && FindRelation(relationType) != &relation)
        return std::unexpected(Error{ErrorCode::NotFound, "relation removed during update", relationType.Name()});
      return {};
    };

    if (auto *listeners = FindListeners(ListenerScope::Relations))
    {
      if (auto ok = listeners->Dispatch(event); !ok)
        return ok;
    }
    if (auto ok = stillBound(); !ok)
      return ok;
    if (auto *listeners = relation.FindListeners(ListenerScope::RelationUpdates))
    {
      if (auto ok = listeners->Dispatch(event.WithScope(relation)); !ok)
        return ok;
    }
    if (auto ok = stillBound(); !ok)
      return ok;
    if (auto *listeners = relationType.FindListeners(ListenerScope::RelationType))
    {
      if (auto ok = listeners->Dispatch(event.WithScope(relationType)); !ok)
        return ok;
    }
    return {};
  }

  EventDispatcher *Relatable::FindListeners(ListenerScope scope) const noexcept
  {
    return m_listeners[static_cast<NGIN::UIntSize>(scope)].get();
  }

  const EventDispatcher *Relatable::GetListeners(ListenerScope scope) const noexcept
  {
    return FindListeners(scope);
  }

  EventDispatcher &Relatable::EnsureListeners(ListenerScope scope)
  {
    auto &slot = m_listeners[static_cast<NGIN::UIntSize>(scope)];
    if (!slot)
      slot = std::make_unique<EventDispatcher>();
    return *slot;
  }

  std::expected<void, Error> Relatable::AddRelationListener(RelationListener &listener, ListenerScope scope)
  {
    return EnsureListeners(scope).Add(listener);
  }

  std::expected<void, Error> Relatable::RemoveRelationListener(RelationListener &listener, ListenerScope scope)
  {
    auto *listeners = FindListeners(scope);
    if (!listeners)
      return std::unexpected(Error{ErrorCode::NotFound, "listener not registered"});
    return listeners->Remove(listener);
  }

  void Relatable::FreezeRelations()
  {
    m_immutable = true;
    for (NGIN::UIntSize i = 0; i < m_relations.Size(); ++i)
    {
      auto &relation = *m_relations[i];
      relation.ProtectTarget();
      static_cast<Relatable &>(relation).FreezeRelations();
    }
  }

  std::expected<void, Error> CopyRelations(Relatable &source, Relatable &target, bool replace)
  {
    for (auto *relation : source.GetRelations())
    {
      auto &type = relation->Type();
      if (!replace && target.HasRelation(type))
        continue;
      if (auto ok = target.SetAny(type, relation->GetAnyTarget()); !ok)
        return std::unexpected(ok.error());
    }
    return {};
  }

} // namespace NGIN::Relations
