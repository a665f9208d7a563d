#pragma once

#include <optional>

namespace edgebook {
namespace analytics {

struct ConfidenceInterval {
    double low = 0.0;
    double high = 0.0;
};

class Statistics {
public:
    // One-sided exact binomial test: P(X >= wins | n = trials, p = null_rate).
    // 1.0 when there are no trials.
    static double binomialPValueGreater(int wins, int trials, double null_rate = 0.5);

    // Wilson score interval for the hit rate, clamped to [0, 1].
    static std::optional<ConfidenceInterval> wilsonInterval(int wins, int trials, double confidence = 0.95);

    // alpha / tests (tests < 1 treated as 1).
    static double bonferroniAlpha(double alpha, int tests);
};

} // namespace analytics
} // namespace edgebook
