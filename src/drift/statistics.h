#pragma once

/// @file statistics.h
/// @brief Distribution functions and order statistics used by the comparators

#include <cstddef>
#include <vector>

namespace sentinel::drift::stats {

/// @brief Percentile of already sorted values using linear interpolation
///        between order statistics (the conventional "linear" method)
/// @param sorted Values in ascending order, must not be empty
/// @param fraction Percentile as a fraction in [0, 1]
double SortedPercentile(const std::vector<double>& sorted, double fraction);

/// @brief Two-sided two-sample Kolmogorov-Smirnov statistic
///
/// D = sup_x |F1(x) - F2(x)| over the empirical CDFs. Tied values are stepped
/// over together on both sides. Inputs are taken by value and sorted.
/// @return D in [0, 1], or 0 if either sample is empty
double KolmogorovSmirnovStatistic(std::vector<double> sample1,
                                  std::vector<double> sample2);

/// @brief Exact P(D >= d) for the two-sample statistic with sizes m and n
///
/// Counts lattice paths that stay inside the band |i/m - j/n| < d. Cost is
/// O(m * n) time and O(max(m, n)) memory.
double KolmogorovSmirnovExactPValue(double d, size_t m, size_t n);

/// @brief Survival function of the limiting Kolmogorov distribution, Q_KS(z)
double KolmogorovSurvival(double z);

/// @brief Asymptotic P(D >= d) for sizes m and n
///
/// Uses the effective size en = m*n/(m+n) with Stephens' small-sample
/// correction: Q_KS((sqrt(en) + 0.12 + 0.11/sqrt(en)) * d).
double KolmogorovSmirnovAsymptoticPValue(double d, size_t m, size_t n);

/// @brief Largest sample size for which KolmogorovSmirnovPValue uses the exact
///        method; both m and n must be at most this
inline constexpr size_t kKsExactMaxSampleSize = 10000;

/// @brief P-value for the two-sample KS statistic
///
/// Exact when max(m, n) <= kKsExactMaxSampleSize, asymptotic beyond.
double KolmogorovSmirnovPValue(double d, size_t m, size_t n);

/// @brief Regularized upper incomplete gamma function Q(a, x)
/// @param a Shape, must be positive
/// @param x Lower integration bound, must be non-negative
double RegularizedGammaQ(double a, double x);

/// @brief Upper tail of the Chi-square distribution, P(X >= x) with dof degrees
///        of freedom
double ChiSquaredSurvival(double x, double dof);

}  // namespace sentinel::drift::stats
