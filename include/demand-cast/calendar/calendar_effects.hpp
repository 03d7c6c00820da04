#pragma once

#include "demand-cast/calendar/islamic_window_table.hpp"
#include "demand-cast/core/calendar_date.hpp"

#include <optional>
#include <string>
#include <vector>

namespace demandcast::calendar {

enum class EffectCause {
	Ramadan,
	PreRamadan,
	Lebaran,
	FixedHoliday,
	Weekend,
	Payday,
	SchoolSeason,
	HarvestSeason
};

std::string toString(EffectCause cause);

/**
 * @struct CalendarEffect
 * @brief A multiplicative demand factor active on a date, tagged with its cause.
 */
struct CalendarEffect {
	EffectCause cause;
	double multiplier = 1.0;
	std::string label;
};

struct FixedHoliday {
	unsigned month = 1;
	unsigned day = 1;
	std::string name;
	double multiplier = 1.0;
};

/// Where Ramadan and Lebaran are resolved from.
enum class IslamicSource {
	/// Tabular Hijri conversion; the window table is consulted only when conversion fails.
	Arithmetic,
	/// The window table only, for announced (sighting-based) dates.
	WindowTable
};

/**
 * @struct CalendarConfig
 * @brief Multipliers and windows of every calendar effect.
 */
struct CalendarConfig {
	IslamicSource islamic_source = IslamicSource::Arithmetic;

	// Ramadan escalates with elapsed days: <= early_days, <= mid_days, later.
	double ramadan_early = 1.3;
	double ramadan_mid = 1.6;
	double ramadan_late = 1.8;
	int ramadan_early_days = 10;
	int ramadan_mid_days = 20;

	double lebaran_peak = 2.2;
	int lebaran_peak_days = 2;
	double lebaran_week = 1.5;
	int lebaran_days = 7;

	double pre_ramadan = 1.1;
	int pre_ramadan_days = 14;

	std::vector<FixedHoliday> fixed_holidays = {
	    {1, 1, "New Year", 0.7},
	    {8, 17, "Independence Day", 1.1},
	    {12, 25, "Christmas", 1.4},
	};

	double weekend = 1.15;

	double payday = 1.15;
	unsigned payday_early_day = 3;  ///< Days 1..payday_early_day of the month.
	unsigned payday_late_day = 28;  ///< Days payday_late_day..end of the month.

	double school_season = 1.2;
	unsigned school_month = 7;
	unsigned school_start_day = 16; ///< Back-to-school runs from this day to the end of school_month.

	double harvest = 1.1;
	std::vector<unsigned> harvest_months = {3, 9};

	/**
	 * @throws std::invalid_argument On negative multipliers, inconsistent windows or invalid holiday dates.
	 */
	void validate() const;
};

/**
 * @class CalendarEffectCalculator
 * @brief Resolves the calendar effects active on a date.
 *
 * Effects fall into three families which the forecast combines separately:
 * Islamic (pre-Ramadan, Ramadan, Lebaran), weekend/holiday and business cycle
 * (payday, school season, harvest). Within a family and across families, effects compose
 * by product. Every call is independent; the calculator holds only immutable configuration.
 */
class CalendarEffectCalculator {
public:
	/**
	 * @throws std::invalid_argument If @p config fails validation.
	 */
	explicit CalendarEffectCalculator(CalendarConfig config = {},
	                                  IslamicWindowTable window_table = IslamicWindowTable());

	std::vector<CalendarEffect> islamicEffects(const core::CalendarDate &date) const;
	std::vector<CalendarEffect> weekendHolidayEffects(const core::CalendarDate &date) const;
	std::vector<CalendarEffect> businessCycleEffects(const core::CalendarDate &date) const;

	/// All active effects, Islamic first.
	std::vector<CalendarEffect> effects(const core::CalendarDate &date) const;

	double islamicMultiplier(const core::CalendarDate &date) const;
	double weekendHolidayMultiplier(const core::CalendarDate &date) const;
	double businessCycleMultiplier(const core::CalendarDate &date) const;

	/// Product of every active effect.
	double multiplier(const core::CalendarDate &date) const;

	bool isRamadan(const core::CalendarDate &date) const;
	bool isLebaran(const core::CalendarDate &date) const;

	/// A fixed-date holiday or one of the Eid peak days.
	bool isHoliday(const core::CalendarDate &date) const;

	/// Name of the fixed-date holiday on @p date.
	std::optional<std::string> holidayName(const core::CalendarDate &date) const;

	const CalendarConfig &config() const {
		return config_;
	}

	const IslamicWindowTable &windowTable() const {
		return window_table_;
	}

private:
	enum class IslamicPhase { None, PreRamadan, Ramadan, Lebaran };

	struct IslamicPosition {
		IslamicPhase phase = IslamicPhase::None;
		int day = 0; ///< 1-based day within Ramadan/Lebaran; days remaining for PreRamadan.
	};

	IslamicPosition locate(const core::CalendarDate &date) const;
	IslamicPosition locateInTable(const core::CalendarDate &date) const;
	const FixedHoliday *fixedHoliday(const core::CalendarDate &date) const;

	static double product(const std::vector<CalendarEffect> &effects);

	CalendarConfig config_;
	IslamicWindowTable window_table_;
};

} // namespace demandcast::calendar
