#include "demand-cast/core/demand_series.hpp"
#include "demand-cast/core/errors.hpp"

#include <cmath>
#include <stdexcept>

namespace demandcast::core {

DemandSeries::DemandSeries(std::vector<DailyObservation> observations) : observations_(std::move(observations)) {
	validate();
}

void DemandSeries::validate() const {
	for (std::size_t i = 0; i < observations_.size(); ++i) {
		const auto &obs = observations_[i];
		if (!std::isfinite(obs.value) || obs.value < 0.0) {
			throw MalformedSeriesError("Demand on " + obs.date.toString() + " must be a non-negative finite value.");
		}
		if (i > 0 && obs.date <= observations_[i - 1].date) {
			throw MalformedSeriesError(obs.date == observations_[i - 1].date
			                               ? "Duplicate observation for " + obs.date.toString() + "."
			                               : "Observations must be in increasing date order (" +
			                                     observations_[i - 1].date.toString() + " before " +
			                                     obs.date.toString() + ").");
		}
	}
}

std::vector<double> DemandSeries::values() const {
	std::vector<double> result;
	result.reserve(observations_.size());
	for (const auto &obs : observations_) {
		result.push_back(obs.value);
	}
	return result;
}

std::optional<CalendarDate> DemandSeries::startDate() const {
	if (observations_.empty()) {
		return std::nullopt;
	}
	return observations_.front().date;
}

std::optional<CalendarDate> DemandSeries::endDate() const {
	if (observations_.empty()) {
		return std::nullopt;
	}
	return observations_.back().date;
}

bool DemandSeries::isContiguous() const {
	if (observations_.empty()) {
		return true;
	}
	return observations_.back().date - observations_.front().date ==
	       static_cast<std::int64_t>(observations_.size()) - 1;
}

DemandSeries DemandSeries::slice(std::size_t begin, std::size_t end) const {
	if (begin > end || end > observations_.size()) {
		throw std::out_of_range("Slice bounds exceed the series length.");
	}
	DemandSeries result;
	result.observations_.assign(observations_.begin() + static_cast<std::ptrdiff_t>(begin),
	                            observations_.begin() + static_cast<std::ptrdiff_t>(end));
	return result;
}

} // namespace demandcast::core
