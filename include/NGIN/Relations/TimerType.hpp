// TimerType.hpp
// Relation type measuring the time since its relation was created
#pragma once

#include <NGIN/Relations/Export.hpp>
#include <NGIN/Relations/RelationType.hpp>

#include <chrono>
#include <memory>

namespace NGIN::Relations
{

  using Milliseconds = std::chrono::milliseconds;

  class NGIN_RELATIONS_API TimerRelation : public Relation<Milliseconds>
  {
  public:
    using Clock = std::chrono::steady_clock;

    TimerRelation(RelationType<Milliseconds> &type, Milliseconds elapsed);

    [[nodiscard]] Milliseconds GetTarget() const override;

  protected:
    // Restarts the timer so that the elapsed time equals the assigned value.
    void AssignTarget(Milliseconds elapsed) override;

  private:
    Clock::time_point m_start;
  };

  /// Value is the time elapsed since the relation was added, computed on every read.
  /// A final timer can never be restarted.
  class NGIN_RELATIONS_API TimerType : public RelationType<Milliseconds>
  {
  public:
    explicit TimerType(std::string_view name, Modifiers modifiers = {});

    [[nodiscard]] std::unique_ptr<Relation<Milliseconds>> NewRelation(Milliseconds elapsed) override;
  };

  inline TimerType NewTimer(std::string_view name, Modifiers modifiers = {})
  {
    return TimerType{name, modifiers};
  }

} // namespace NGIN::Relations
