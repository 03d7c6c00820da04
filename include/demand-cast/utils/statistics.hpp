#pragma once

#include <cstddef>
#include <vector>

namespace demandcast::utils::stats {

/// Arithmetic mean; 0 for an empty input.
double mean(const std::vector<double> &data);

/// Population variance; 0 for fewer than one value.
double variance(const std::vector<double> &data);

/// Population standard deviation.
double stdDev(const std::vector<double> &data);

/**
 * @brief Lag-k autocorrelation normalised by the total sum of squares.
 *
 * r_k = sum_{i<n-k} (x_i - mu)(x_{i+k} - mu) / sum_i (x_i - mu)^2.
 * Returns 0 when the series is constant or shorter than the lag.
 */
double autocorrelation(const std::vector<double> &data, std::size_t lag);

/**
 * @brief Error function via Abramowitz & Stegun formula 7.1.26.
 *
 * Maximum absolute error is about 1.5e-7, which is the precision the Mann-Kendall
 * p-values are reproduced to.
 */
double erf(double x);

/// Standard normal CDF built on the approximated erf above.
double normalCdf(double z);

/**
 * @brief Inverse of the standard normal CDF (Acklam's rational approximation).
 * @throws std::invalid_argument Unless 0 < p < 1.
 */
double normalQuantile(double p);

} // namespace demandcast::utils::stats
