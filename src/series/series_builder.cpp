#include "demand-cast/series/series_builder.hpp"
#include "demand-cast/core/errors.hpp"
#include "demand-cast/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace demandcast::series {

SeriesBuilder::SeriesBuilder(std::shared_ptr<const calendar::CalendarEffectCalculator> calendar)
    : calendar_(std::move(calendar)) {
	if (!calendar_) {
		throw std::invalid_argument("SeriesBuilder requires a calendar.");
	}
}

core::DailyObservation SeriesBuilder::observe(const core::CalendarDate &date, double value) const {
	return core::DailyObservation::on(date, value, calendar_->isHoliday(date));
}

core::RawSeries SeriesBuilder::build(const std::vector<DemandEvent> &events, const core::CalendarDate &start,
                                     const core::CalendarDate &end) const {
	if (start > end) {
		throw core::InvalidRangeError("Series start " + start.toString() + " is after end " + end.toString() + ".");
	}

	const auto days = static_cast<std::size_t>(end - start) + 1;
	std::vector<double> totals(days, 0.0);
	std::size_t ignored = 0;

	for (const auto &event : events) {
		if (event.date < start || event.date > end) {
			++ignored;
			continue;
		}
		if (!std::isfinite(event.quantity_change)) {
			throw core::MalformedSeriesError("Non-finite quantity on " + event.date.toString() + ".");
		}
		if (event.quantity_change < 0.0) {
			totals[static_cast<std::size_t>(event.date - start)] += std::abs(event.quantity_change);
		}
	}

	if (ignored > 0) {
		DEMANDCAST_DEBUG("SeriesBuilder ignored {} events outside {}..{}.", ignored, start.toString(), end.toString());
	}

	std::vector<core::DailyObservation> observations;
	observations.reserve(days);
	for (std::size_t i = 0; i < days; ++i) {
		observations.push_back(observe(start.addDays(static_cast<std::int64_t>(i)), totals[i]));
	}
	return core::RawSeries(std::move(observations));
}

core::RawSeries
SeriesBuilder::fromDailyTotals(const std::vector<std::pair<core::CalendarDate, double>> &totals) const {
	std::vector<core::DailyObservation> observations;
	if (totals.empty()) {
		return core::RawSeries(std::move(observations));
	}

	for (std::size_t i = 0; i < totals.size(); ++i) {
		const auto &entry = totals[i];
		if (!std::isfinite(entry.second) || entry.second < 0.0) {
			throw core::MalformedSeriesError("Daily total on " + entry.first.toString() +
			                                 " must be a non-negative number.");
		}
		if (i > 0) {
			const auto &previous = totals[i - 1].first;
			if (entry.first <= previous) {
				throw core::MalformedSeriesError("Daily totals must have strictly increasing dates: " +
				                                 entry.first.toString() + " follows " + previous.toString() + ".");
			}
			for (auto gap = previous.addDays(1); gap < entry.first; gap = gap.addDays(1)) {
				observations.push_back(observe(gap, 0.0));
			}
		}
		observations.push_back(observe(entry.first, entry.second));
	}
	return core::RawSeries(std::move(observations));
}

} // namespace demandcast::series
