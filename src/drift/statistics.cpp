#include "drift/statistics.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace sentinel::drift::stats {

namespace {

constexpr int kMaxGammaIterations = 500;
constexpr double kGammaEpsilon = 1e-15;
constexpr double kTiny = std::numeric_limits<double>::min() / kGammaEpsilon;

// Series expansion of P(a, x), converges quickly for x < a + 1
double GammaPSeries(double a, double x) {
    double term = 1.0 / a;
    double sum = term;
    double ap = a;
    for (int i = 0; i < kMaxGammaIterations; ++i) {
        ap += 1.0;
        term *= x / ap;
        sum += term;
        if (std::abs(term) < std::abs(sum) * kGammaEpsilon) {
            break;
        }
    }
    return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
}

// Continued fraction for Q(a, x) (modified Lentz), valid for x >= a + 1
double GammaQContinuedFraction(double a, double x) {
    double b = x + 1.0 - a;
    double c = 1.0 / kTiny;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= kMaxGammaIterations; ++i) {
        const double an = -i * (i - a);
        b += 2.0;
        d = an * d + b;
        if (std::abs(d) < kTiny) d = kTiny;
        c = b + an / c;
        if (std::abs(c) < kTiny) c = kTiny;
        d = 1.0 / d;
        const double delta = d * c;
        h *= delta;
        if (std::abs(delta - 1.0) < kGammaEpsilon) {
            break;
        }
    }
    return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
}

}  // namespace

double SortedPercentile(const std::vector<double>& sorted, double fraction) {
    if (sorted.size() == 1) {
        return sorted.front();
    }
    fraction = std::clamp(fraction, 0.0, 1.0);

    const double index = fraction * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(index));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double t = index - static_cast<double>(lo);

    const double a = sorted[lo];
    const double b = sorted[hi];
    const double diff = b - a;
    // Interpolate from the nearer end so equal neighbours reproduce exactly
    if (t >= 0.5) {
        return b - diff * (1.0 - t);
    }
    return a + diff * t;
}

double KolmogorovSmirnovStatistic(std::vector<double> sample1,
                                  std::vector<double> sample2) {
    if (sample1.empty() || sample2.empty()) {
        return 0.0;
    }

    std::sort(sample1.begin(), sample1.end());
    std::sort(sample2.begin(), sample2.end());

    const double n1 = static_cast<double>(sample1.size());
    const double n2 = static_cast<double>(sample2.size());

    size_t i = 0, j = 0;
    double d = 0.0;

    while (i < sample1.size() && j < sample2.size()) {
        const double x = std::min(sample1[i], sample2[j]);
        while (i < sample1.size() && sample1[i] <= x) ++i;
        while (j < sample2.size() && sample2[j] <= x) ++j;

        const double cdf1 = static_cast<double>(i) / n1;
        const double cdf2 = static_cast<double>(j) / n2;
        d = std::max(d, std::abs(cdf1 - cdf2));
    }

    // Once one side is exhausted its CDF is 1 and the gap can only shrink
    return d;
}

double KolmogorovSmirnovExactPValue(double d, size_t m, size_t n) {
    if (m == 0 || n == 0) {
        return 1.0;
    }
    if (m > n) {
        std::swap(m, n);
    }

    const double md = static_cast<double>(m);
    const double nd = static_cast<double>(n);
    // Lattice statistics are multiples of 1/(m*n); snap just below d
    const double q = (0.5 + std::floor(d * md * nd - 1e-7)) / (md * nd);

    std::vector<double> u(n + 1);
    for (size_t j = 0; j <= n; ++j) {
        u[j] = (static_cast<double>(j) / nd > q) ? 0.0 : 1.0;
    }

    for (size_t i = 1; i <= m; ++i) {
        const double w = static_cast<double>(i) / static_cast<double>(i + n);
        const double fi = static_cast<double>(i) / md;
        u[0] = (fi > q) ? 0.0 : w * u[0];
        for (size_t j = 1; j <= n; ++j) {
            if (std::abs(fi - static_cast<double>(j) / nd) > q) {
                u[j] = 0.0;
            } else {
                u[j] = w * u[j] + u[j - 1];
            }
        }
    }

    // u[n] is P(D < d)
    return std::clamp(1.0 - u[n], 0.0, 1.0);
}

double KolmogorovSurvival(double z) {
    if (z < 0.042) {
        // CDF is below 1e-300 here and the small-z series would underflow
        return 1.0;
    }
    if (z < 1.18) {
        // Small z: P_KS(z) = sqrt(2 pi)/z * sum exp(-(2k-1)^2 pi^2 / (8 z^2))
        const double y = std::exp(-1.23370055013616983 / (z * z));
        const double cdf = 2.25675833419102515 * std::sqrt(-std::log(y)) *
                           (y + std::pow(y, 9) + std::pow(y, 25) + std::pow(y, 49));
        return std::clamp(1.0 - cdf, 0.0, 1.0);
    }
    // Large z: Q_KS(z) = 2 sum (-1)^(k-1) exp(-2 k^2 z^2)
    const double x = std::exp(-2.0 * z * z);
    return std::clamp(2.0 * (x - std::pow(x, 4) + std::pow(x, 9)), 0.0, 1.0);
}

double KolmogorovSmirnovAsymptoticPValue(double d, size_t m, size_t n) {
    if (m == 0 || n == 0 || d <= 0.0) {
        return 1.0;
    }
    const double en = std::sqrt(static_cast<double>(m) * static_cast<double>(n) /
                                static_cast<double>(m + n));
    return KolmogorovSurvival((en + 0.12 + 0.11 / en) * d);
}

double KolmogorovSmirnovPValue(double d, size_t m, size_t n) {
    if (m == 0 || n == 0) {
        return 1.0;
    }
    if (std::max(m, n) <= kKsExactMaxSampleSize) {
        return KolmogorovSmirnovExactPValue(d, m, n);
    }
    return KolmogorovSmirnovAsymptoticPValue(d, m, n);
}

double RegularizedGammaQ(double a, double x) {
    if (x <= 0.0 || a <= 0.0) {
        return 1.0;
    }
    if (x < a + 1.0) {
        return std::clamp(1.0 - GammaPSeries(a, x), 0.0, 1.0);
    }
    return std::clamp(GammaQContinuedFraction(a, x), 0.0, 1.0);
}

double ChiSquaredSurvival(double x, double dof) {
    if (dof <= 0.0) {
        return 1.0;
    }
    if (x <= 0.0) {
        return 1.0;
    }
    return RegularizedGammaQ(0.5 * dof, 0.5 * x);
}

}  // namespace sentinel::drift::stats
