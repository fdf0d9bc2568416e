#include <chroma_composite_engine/cce_timing_gate.h>

namespace cce {

TimingGate::TimingGate(TimeUS start_us, std::optional<TimeUS> end_us)
    : m_start_us(start_us), m_end_us(end_us) {
}

GateState TimingGate::evaluate(TimeUS t_us) const {
    if (t_us < m_start_us) {
        return GateState::Inactive;
    }
    if (m_end_us && t_us >= *m_end_us) {
        return GateState::Inactive;
    }
    return GateState::Active;
}

} // namespace cce
