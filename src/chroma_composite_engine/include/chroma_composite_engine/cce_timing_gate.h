#pragma once

#include "cce_time.h"
#include <optional>

namespace cce {

enum class GateState {
    Inactive,
    Active
};

// Decides from the output timestamp alone whether the composite is shown.
// Active iff start <= t < end (or t >= start without an end).
class TimingGate {
public:
    explicit TimingGate(TimeUS start_us, std::optional<TimeUS> end_us = std::nullopt);

    GateState evaluate(TimeUS t_us) const;
    bool is_active(TimeUS t_us) const { return evaluate(t_us) == GateState::Active; }

    TimeUS start_us() const { return m_start_us; }
    std::optional<TimeUS> end_us() const { return m_end_us; }

private:
    TimeUS m_start_us;
    std::optional<TimeUS> m_end_us;
};

} // namespace cce
