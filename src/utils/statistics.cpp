#include "demand-cast/utils/statistics.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace demandcast::utils::stats {

double mean(const std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double variance(const std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	const double mu = mean(data);
	double accum = 0.0;
	for (double v : data) {
		const double diff = v - mu;
		accum += diff * diff;
	}
	return accum / static_cast<double>(data.size());
}

double stdDev(const std::vector<double> &data) {
	return std::sqrt(variance(data));
}

double autocorrelation(const std::vector<double> &data, std::size_t lag) {
	const std::size_t n = data.size();
	if (lag == 0 || n <= lag) {
		return 0.0;
	}
	const double mu = mean(data);
	double denom = 0.0;
	for (double v : data) {
		denom += (v - mu) * (v - mu);
	}
	if (denom <= 0.0) {
		return 0.0;
	}
	double numerator = 0.0;
	for (std::size_t i = 0; i + lag < n; ++i) {
		numerator += (data[i] - mu) * (data[i + lag] - mu);
	}
	return numerator / denom;
}

double erf(double x) {
	constexpr double a1 = 0.254829592;
	constexpr double a2 = -0.284496736;
	constexpr double a3 = 1.421413741;
	constexpr double a4 = -1.453152027;
	constexpr double a5 = 1.061405429;
	constexpr double p = 0.3275911;

	const double sign = x < 0.0 ? -1.0 : 1.0;
	const double ax = std::abs(x);
	const double t = 1.0 / (1.0 + p * ax);
	const double y = 1.0 - (((((a5 * t + a4) * t) + a3) * t + a2) * t + a1) * t * std::exp(-ax * ax);
	return sign * y;
}

double normalCdf(double z) {
	return 0.5 * (1.0 + erf(z / std::sqrt(2.0)));
}

double normalQuantile(double p) {
	if (!(p > 0.0 && p < 1.0)) {
		throw std::invalid_argument("Normal quantile requires 0 < p < 1.");
	}

	static constexpr double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
	                               1.383577518672690e+02,  -3.066479806614716e+01, 2.506628277459239e+00};
	static constexpr double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
	                               6.680131188771972e+01,  -1.328068155288572e+01};
	static constexpr double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
	                               -2.549732539343734e+00, 4.374664141464968e+00,  2.938163982698783e+00};
	static constexpr double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
	                               3.754408661907416e+00};
	constexpr double p_low = 0.02425;
	constexpr double p_high = 1.0 - p_low;

	if (p < p_low) {
		const double q = std::sqrt(-2.0 * std::log(p));
		return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}
	if (p > p_high) {
		const double q = std::sqrt(-2.0 * std::log(1.0 - p));
		return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}
	const double q = p - 0.5;
	const double r = q * q;
	return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
	       (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
}

} // namespace demandcast::utils::stats
