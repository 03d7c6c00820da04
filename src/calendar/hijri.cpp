#include "demand-cast/calendar/hijri.hpp"
#include "demand-cast/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace demandcast::calendar {

namespace {

constexpr std::int64_t kUnixEpochJdn = 2440588;
constexpr std::int64_t kIslamicEpochJdn = 1948440;

std::int64_t islamicToJdn(std::int64_t year, std::int64_t month, std::int64_t day) {
	return day + static_cast<std::int64_t>(std::ceil(29.5 * static_cast<double>(month - 1))) + (year - 1) * 354 +
	       static_cast<std::int64_t>(std::floor((3.0 + 11.0 * static_cast<double>(year)) / 30.0)) + kIslamicEpochJdn - 1;
}

} // namespace

HijriDate HijriConverter::toHijri(const core::CalendarDate &date) {
	if (date.year() < kMinGregorianYear || date.year() > kMaxGregorianYear) {
		throw core::CalendarConversionError("Hijri conversion supports Gregorian years " +
		                                    std::to_string(kMinGregorianYear) + "-" +
		                                    std::to_string(kMaxGregorianYear) + ", got " + date.toString() + ".");
	}

	const std::int64_t jdn = date.toDays() + kUnixEpochJdn;
	const auto year = static_cast<std::int64_t>(
	    std::floor((30.0 * static_cast<double>(jdn - kIslamicEpochJdn) + 10646.0) / 10631.0));
	const auto month_estimate = static_cast<std::int64_t>(
	    std::ceil(static_cast<double>(jdn - (29 + islamicToJdn(year, 1, 1))) / 29.5) + 1.0);
	const std::int64_t month = std::min<std::int64_t>(12, month_estimate);
	const std::int64_t day = jdn - islamicToJdn(year, month, 1) + 1;

	return HijriDate{static_cast<int>(year), static_cast<int>(month), static_cast<int>(day)};
}

core::CalendarDate HijriConverter::toGregorian(int year, int month, int day) {
	return core::CalendarDate::fromDays(islamicToJdn(year, month, day) - kUnixEpochJdn);
}

} // namespace demandcast::calendar
