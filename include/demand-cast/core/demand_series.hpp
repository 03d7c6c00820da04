#pragma once

#include "demand-cast/core/calendar_date.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace demandcast::core {

/**
 * @struct DailyObservation
 * @brief Demand recorded for one calendar day together with its calendar context.
 */
struct DailyObservation {
	CalendarDate date;
	double value = 0.0;
	int day_of_week = 0;
	bool is_weekend = false;
	bool is_holiday = false;

	/// Builds an observation, deriving day-of-week and weekend flag from @p date.
	static DailyObservation on(CalendarDate date, double value, bool is_holiday = false) {
		return DailyObservation{date, value, date.dayOfWeek(), date.isWeekend(), is_holiday};
	}

	friend bool operator==(const DailyObservation &lhs, const DailyObservation &rhs) {
		return lhs.date == rhs.date && lhs.value == rhs.value && lhs.day_of_week == rhs.day_of_week &&
		       lhs.is_weekend == rhs.is_weekend && lhs.is_holiday == rhs.is_holiday;
	}
	friend bool operator!=(const DailyObservation &lhs, const DailyObservation &rhs) {
		return !(lhs == rhs);
	}
};

/**
 * @class DemandSeries
 * @brief An immutable, date-ordered sequence of daily observations.
 *
 * The constructor enforces strictly increasing dates and non-negative finite
 * values. Gap-free construction is the job of SeriesBuilder; a series produced by
 * outlier removal keeps its order but may skip days.
 */
class DemandSeries {
public:
	using const_iterator = std::vector<DailyObservation>::const_iterator;

	DemandSeries() = default;

	/**
	 * @throws MalformedSeriesError On duplicate or decreasing dates, or on negative / non-finite values.
	 */
	explicit DemandSeries(std::vector<DailyObservation> observations);

	const std::vector<DailyObservation> &observations() const {
		return observations_;
	}

	/// Copies the demand values out in date order.
	std::vector<double> values() const;

	std::size_t size() const {
		return observations_.size();
	}

	bool empty() const {
		return observations_.empty();
	}

	const DailyObservation &operator[](std::size_t index) const {
		return observations_[index];
	}

	const DailyObservation &at(std::size_t index) const {
		return observations_.at(index);
	}

	const_iterator begin() const {
		return observations_.begin();
	}

	const_iterator end() const {
		return observations_.end();
	}

	std::optional<CalendarDate> startDate() const;
	std::optional<CalendarDate> endDate() const;

	/// True when the series holds exactly one observation for every day between its first and last date.
	bool isContiguous() const;

	/**
	 * @brief Returns the observations in [begin, end).
	 * @throws std::out_of_range If the bounds exceed the series.
	 */
	DemandSeries slice(std::size_t begin, std::size_t end) const;

	friend bool operator==(const DemandSeries &lhs, const DemandSeries &rhs) {
		return lhs.observations_ == rhs.observations_;
	}
	friend bool operator!=(const DemandSeries &lhs, const DemandSeries &rhs) {
		return !(lhs == rhs);
	}

private:
	void validate() const;

	std::vector<DailyObservation> observations_;
};

/// A gap-free series as produced by SeriesBuilder.
using RawSeries = DemandSeries;

/// A series with statistical outliers removed.
using CleanedSeries = DemandSeries;

/// Identity of the product (or aggregate) a series describes, used to label results.
struct ProductInfo {
	std::string id;
	std::string name;
	double unit_price = 0.0;
};

} // namespace demandcast::core
