#pragma once

#include "cce_time.h"
#include <cmath>

namespace cce {

// Rate utilities for canonical snapping and comparison
class RateUtils {
public:
    // Check if two rates are "close" (within 0.2% tolerance)
    // This treats 23.976<->24 and 29.97<->30 as "close"
    static bool are_close(const Rate& a, const Rate& b) {
        double fps_a = a.to_fps();
        double fps_b = b.to_fps();
        if (fps_b == 0.0) return false;
        return std::abs(fps_a - fps_b) / fps_b <= 0.002;
    }

    // Snap rate to the nearest canonical rate within tolerance
    // Returns original rate if no canonical rate is close
    static Rate snap_to_canonical(const Rate& r) {
        using namespace canonical_rates;

        static const Rate canonicals[] = {
            RATE_23_976, RATE_24, RATE_25,
            RATE_29_97, RATE_30, RATE_50,
            RATE_59_94, RATE_60
        };

        const Rate* best = nullptr;
        double best_diff = 0.0;
        for (const auto& canonical : canonicals) {
            if (!are_close(r, canonical)) continue;
            double diff = std::abs(r.to_fps() - canonical.to_fps());
            if (!best || diff < best_diff) {
                best = &canonical;
                best_diff = diff;
            }
        }
        return best ? *best : r;
    }
};

} // namespace cce
