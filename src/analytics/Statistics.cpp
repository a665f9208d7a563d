#include "analytics/Statistics.h"
#include "common/Errors.h"

#include <boost/math/distributions/binomial.hpp>
#include <boost/math/distributions/complement.hpp>
#include <boost/math/distributions/normal.hpp>
#include <algorithm>
#include <cmath>

namespace edgebook {
namespace analytics {

double Statistics::binomialPValueGreater(int wins, int trials, double null_rate) {
    if (trials <= 0 || wins <= 0) {
        return 1.0;
    }
    if (null_rate <= 0.0 || null_rate >= 1.0) {
        throw ConfigurationError("Binomial null hit rate must lie strictly between 0 and 1");
    }
    wins = std::min(wins, trials);

    const boost::math::binomial_distribution<double> dist(static_cast<double>(trials), null_rate);
    // cdf(complement(dist, k)) = P(X > k), so P(X >= wins) = P(X > wins - 1).
    const double p = boost::math::cdf(boost::math::complement(dist, static_cast<double>(wins - 1)));
    return std::clamp(p, 0.0, 1.0);
}

std::optional<ConfidenceInterval> Statistics::wilsonInterval(int wins, int trials, double confidence) {
    if (trials <= 0) {
        return std::nullopt;
    }
    if (confidence <= 0.0 || confidence >= 1.0) {
        throw ConfigurationError("Confidence level must lie strictly between 0 and 1");
    }
    wins = std::clamp(wins, 0, trials);

    const boost::math::normal_distribution<double> standard_normal;
    const double z = boost::math::quantile(standard_normal, 0.5 + confidence / 2.0);
    const double z2 = z * z;
    const double n = static_cast<double>(trials);
    const double p = static_cast<double>(wins) / n;

    const double denominator = 1.0 + z2 / n;
    const double center = (p + z2 / (2.0 * n)) / denominator;
    const double spread = z * std::sqrt(p * (1.0 - p) / n + z2 / (4.0 * n * n)) / denominator;

    ConfidenceInterval ci;
    // Rounding can push a bound past the observed rate at p = 0 or p = 1.
    ci.low = std::clamp(center - spread, 0.0, p);
    ci.high = std::clamp(center + spread, p, 1.0);
    return ci;
}

double Statistics::bonferroniAlpha(double alpha, int tests) {
    return alpha / static_cast<double>(std::max(tests, 1));
}

} // namespace analytics
} // namespace edgebook
