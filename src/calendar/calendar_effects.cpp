#include "demand-cast/calendar/calendar_effects.hpp"
#include "demand-cast/calendar/hijri.hpp"
#include "demand-cast/core/errors.hpp"
#include "demand-cast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace demandcast::calendar {

namespace {

void requireMultiplier(double value, const char *name) {
	if (!(value >= 0.0) || !std::isfinite(value)) {
		throw std::invalid_argument(std::string("Calendar multiplier '") + name + "' must be a non-negative number.");
	}
}

} // namespace

std::string toString(EffectCause cause) {
	switch (cause) {
	case EffectCause::Ramadan:
		return "ramadan";
	case EffectCause::PreRamadan:
		return "pre_ramadan";
	case EffectCause::Lebaran:
		return "lebaran";
	case EffectCause::FixedHoliday:
		return "fixed_holiday";
	case EffectCause::Weekend:
		return "weekend";
	case EffectCause::Payday:
		return "payday";
	case EffectCause::SchoolSeason:
		return "school_season";
	case EffectCause::HarvestSeason:
		return "harvest_season";
	}
	return "unknown";
}

void CalendarConfig::validate() const {
	requireMultiplier(ramadan_early, "ramadan_early");
	requireMultiplier(ramadan_mid, "ramadan_mid");
	requireMultiplier(ramadan_late, "ramadan_late");
	requireMultiplier(lebaran_peak, "lebaran_peak");
	requireMultiplier(lebaran_week, "lebaran_week");
	requireMultiplier(pre_ramadan, "pre_ramadan");
	requireMultiplier(weekend, "weekend");
	requireMultiplier(payday, "payday");
	requireMultiplier(school_season, "school_season");
	requireMultiplier(harvest, "harvest");

	if (ramadan_early_days < 1 || ramadan_mid_days < ramadan_early_days) {
		throw std::invalid_argument("Ramadan escalation days must satisfy 1 <= early <= mid.");
	}
	if (lebaran_days < 0 || lebaran_peak_days < 0 || lebaran_peak_days > lebaran_days) {
		throw std::invalid_argument("Lebaran windows must satisfy 0 <= peak days <= total days.");
	}
	if (pre_ramadan_days < 0) {
		throw std::invalid_argument("Pre-Ramadan window must not be negative.");
	}
	if (payday_early_day > 31 || payday_late_day < 1 || payday_late_day > 31) {
		throw std::invalid_argument("Payday days must lie within a month.");
	}
	if (school_month < 1 || school_month > 12 || school_start_day < 1 || school_start_day > 31) {
		throw std::invalid_argument("School season must lie within a month.");
	}
	for (unsigned month : harvest_months) {
		if (month < 1 || month > 12) {
			throw std::invalid_argument("Harvest months must be between 1 and 12.");
		}
	}
	for (const auto &holiday : fixed_holidays) {
		// 2000 is a leap year, so Feb 29 holidays are accepted.
		if (holiday.month < 1 || holiday.month > 12 || holiday.day < 1 ||
		    holiday.day > core::CalendarDate::daysInMonth(2000, holiday.month)) {
			throw std::invalid_argument("Fixed holiday '" + holiday.name + "' has an invalid date.");
		}
		requireMultiplier(holiday.multiplier, holiday.name.c_str());
	}
}

CalendarEffectCalculator::CalendarEffectCalculator(CalendarConfig config, IslamicWindowTable window_table)
    : config_(std::move(config)), window_table_(std::move(window_table)) {
	config_.validate();
	if (config_.islamic_source == IslamicSource::WindowTable && window_table_.empty()) {
		DEMANDCAST_WARN("Islamic source is the window table, but no table was supplied. Islamic effects are off.");
	}
}

CalendarEffectCalculator::IslamicPosition CalendarEffectCalculator::locate(const core::CalendarDate &date) const {
	if (config_.islamic_source == IslamicSource::WindowTable) {
		return locateInTable(date);
	}

	HijriDate hijri;
	try {
		hijri = HijriConverter::toHijri(date);
	} catch (const core::CalendarConversionError &ex) {
		DEMANDCAST_DEBUG("{} Falling back to the Islamic window table.", ex.what());
		return locateInTable(date);
	}

	if (hijri.month == 9) {
		return {IslamicPhase::Ramadan, hijri.day};
	}
	if (hijri.month == 10 && hijri.day <= config_.lebaran_days) {
		return {IslamicPhase::Lebaran, hijri.day};
	}
	if (hijri.month < 9 && config_.pre_ramadan_days > 0) {
		const auto ramadan_start = HijriConverter::toGregorian(hijri.year, 9, 1);
		const auto days_left = ramadan_start - date;
		if (days_left >= 1 && days_left <= config_.pre_ramadan_days) {
			return {IslamicPhase::PreRamadan, static_cast<int>(days_left)};
		}
	}
	return {};
}

CalendarEffectCalculator::IslamicPosition
CalendarEffectCalculator::locateInTable(const core::CalendarDate &date) const {
	if (const auto ramadan = window_table_.ramadanContaining(date)) {
		return {IslamicPhase::Ramadan, static_cast<int>(date - ramadan->ramadan_start) + 1};
	}
	if (const auto lebaran = window_table_.lebaranContaining(date)) {
		const int day = static_cast<int>(date - lebaran->lebaran_start) + 1;
		if (day <= config_.lebaran_days) {
			return {IslamicPhase::Lebaran, day};
		}
		return {};
	}
	if (config_.pre_ramadan_days > 0) {
		for (int year : {date.year(), date.year() + 1}) {
			const auto windows = window_table_.find(year);
			if (!windows) {
				continue;
			}
			const auto days_left = windows->ramadan_start - date;
			if (days_left >= 1 && days_left <= config_.pre_ramadan_days) {
				return {IslamicPhase::PreRamadan, static_cast<int>(days_left)};
			}
		}
	}
	return {};
}

const FixedHoliday *CalendarEffectCalculator::fixedHoliday(const core::CalendarDate &date) const {
	const auto it = std::find_if(config_.fixed_holidays.begin(), config_.fixed_holidays.end(),
	                             [&](const FixedHoliday &h) { return h.month == date.month() && h.day == date.day(); });
	return it == config_.fixed_holidays.end() ? nullptr : &*it;
}

std::vector<CalendarEffect> CalendarEffectCalculator::islamicEffects(const core::CalendarDate &date) const {
	const auto position = locate(date);
	switch (position.phase) {
	case IslamicPhase::Ramadan: {
		double factor = config_.ramadan_late;
		if (position.day <= config_.ramadan_early_days) {
			factor = config_.ramadan_early;
		} else if (position.day <= config_.ramadan_mid_days) {
			factor = config_.ramadan_mid;
		}
		return {{EffectCause::Ramadan, factor, "Ramadan day " + std::to_string(position.day)}};
	}
	case IslamicPhase::Lebaran: {
		const double factor = position.day <= config_.lebaran_peak_days ? config_.lebaran_peak : config_.lebaran_week;
		return {{EffectCause::Lebaran, factor, "Lebaran day " + std::to_string(position.day)}};
	}
	case IslamicPhase::PreRamadan:
		return {{EffectCause::PreRamadan, config_.pre_ramadan,
		         "Pre-Ramadan (" + std::to_string(position.day) + " days to go)"}};
	case IslamicPhase::None:
		break;
	}
	return {};
}

std::vector<CalendarEffect> CalendarEffectCalculator::weekendHolidayEffects(const core::CalendarDate &date) const {
	std::vector<CalendarEffect> result;
	if (const auto *holiday = fixedHoliday(date)) {
		result.push_back({EffectCause::FixedHoliday, holiday->multiplier, holiday->name});
	}
	if (date.isWeekend()) {
		result.push_back({EffectCause::Weekend, config_.weekend, "Weekend"});
	}
	return result;
}

std::vector<CalendarEffect> CalendarEffectCalculator::businessCycleEffects(const core::CalendarDate &date) const {
	std::vector<CalendarEffect> result;
	const unsigned day = date.day();
	if (day <= config_.payday_early_day || day >= config_.payday_late_day) {
		result.push_back({EffectCause::Payday, config_.payday, "Payday period"});
	}
	if (date.month() == config_.school_month && day >= config_.school_start_day) {
		result.push_back({EffectCause::SchoolSeason, config_.school_season, "Back to school"});
	}
	if (std::find(config_.harvest_months.begin(), config_.harvest_months.end(), date.month()) !=
	    config_.harvest_months.end()) {
		result.push_back({EffectCause::HarvestSeason, config_.harvest, "Harvest season"});
	}
	return result;
}

std::vector<CalendarEffect> CalendarEffectCalculator::effects(const core::CalendarDate &date) const {
	auto result = islamicEffects(date);
	auto weekend_holiday = weekendHolidayEffects(date);
	auto business = businessCycleEffects(date);
	result.insert(result.end(), weekend_holiday.begin(), weekend_holiday.end());
	result.insert(result.end(), business.begin(), business.end());
	return result;
}

double CalendarEffectCalculator::product(const std::vector<CalendarEffect> &effects) {
	double total = 1.0;
	for (const auto &effect : effects) {
		total *= effect.multiplier;
	}
	return total;
}

double CalendarEffectCalculator::islamicMultiplier(const core::CalendarDate &date) const {
	return product(islamicEffects(date));
}

double CalendarEffectCalculator::weekendHolidayMultiplier(const core::CalendarDate &date) const {
	return product(weekendHolidayEffects(date));
}

double CalendarEffectCalculator::businessCycleMultiplier(const core::CalendarDate &date) const {
	return product(businessCycleEffects(date));
}

double CalendarEffectCalculator::multiplier(const core::CalendarDate &date) const {
	return product(effects(date));
}

bool CalendarEffectCalculator::isRamadan(const core::CalendarDate &date) const {
	return locate(date).phase == IslamicPhase::Ramadan;
}

bool CalendarEffectCalculator::isLebaran(const core::CalendarDate &date) const {
	return locate(date).phase == IslamicPhase::Lebaran;
}

bool CalendarEffectCalculator::isHoliday(const core::CalendarDate &date) const {
	if (fixedHoliday(date) != nullptr) {
		return true;
	}
	const auto position = locate(date);
	return position.phase == IslamicPhase::Lebaran && position.day <= config_.lebaran_peak_days;
}

std::optional<std::string> CalendarEffectCalculator::holidayName(const core::CalendarDate &date) const {
	if (const auto *holiday = fixedHoliday(date)) {
		return holiday->name;
	}
	return std::nullopt;
}

} // namespace demandcast::calendar
