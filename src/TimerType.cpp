#include <NGIN/Relations/TimerType.hpp>

namespace NGIN::Relations
{

  TimerRelation::TimerRelation(RelationType<Milliseconds> &type, Milliseconds elapsed)
      : Relation<Milliseconds>(type, elapsed), m_start(Clock::now() - elapsed)
  {
  }

  Milliseconds TimerRelation::GetTarget() const
  {
    return std::chrono::duration_cast<Milliseconds>(Clock::now() - m_start);
  }

  void TimerRelation::AssignTarget(Milliseconds elapsed)
  {
    m_start = Clock::now() - elapsed;
    m_target = elapsed;
  }

  TimerType::TimerType(std::string_view name, Modifiers modifiers)
      : RelationType<Milliseconds>(name, nullptr, [](Relatable &)
                                   { return Milliseconds{0}; }, modifiers)
  {
  }

  std::unique_ptr<Relation<Milliseconds>> TimerType::NewRelation(Milliseconds elapsed)
  {
    return std::make_unique<TimerRelation>(*this, elapsed);
  }

} // namespace NGIN::Relations
