#pragma once

#include "demand-cast/calendar/calendar_effects.hpp"
#include "demand-cast/core/demand_series.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace demandcast::series {

/**
 * @struct DemandEvent
 * @brief A signed stock movement. Negative quantities are outgoing (demand).
 */
struct DemandEvent {
	core::CalendarDate date;
	double quantity_change = 0.0;
};

/**
 * @class SeriesBuilder
 * @brief Turns transaction events into a gap-free daily demand series.
 *
 * One observation is emitted for every day in [start, end]; days without outgoing
 * movements are materialised with value 0. Day-of-week, weekend and holiday flags are
 * attached from the calendar.
 */
class SeriesBuilder {
public:
	explicit SeriesBuilder(std::shared_ptr<const calendar::CalendarEffectCalculator> calendar =
	                           std::make_shared<const calendar::CalendarEffectCalculator>());

	/**
	 * @brief Aggregates @p events into daily demand.
	 *
	 * The absolute quantities of outgoing movements are summed per day. Incoming movements and
	 * events outside [start, end] are ignored.
	 *
	 * @throws core::InvalidRangeError If start > end.
	 */
	core::RawSeries build(const std::vector<DemandEvent> &events, const core::CalendarDate &start,
	                      const core::CalendarDate &end) const;

	/**
	 * @brief Builds a series from pre-aggregated daily totals, zero-filling missing days.
	 *
	 * @throws core::MalformedSeriesError On non-increasing or duplicate dates, or negative / non-finite totals.
	 */
	core::RawSeries fromDailyTotals(const std::vector<std::pair<core::CalendarDate, double>> &totals) const;

private:
	core::DailyObservation observe(const core::CalendarDate &date, double value) const;

	std::shared_ptr<const calendar::CalendarEffectCalculator> calendar_;
};

} // namespace demandcast::series
