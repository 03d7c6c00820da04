#pragma once

#include "demand-cast/core/calendar_date.hpp"

namespace demandcast::calendar {

/**
 * @struct HijriDate
 * @brief A date in the arithmetic (tabular) Islamic calendar.
 */
struct HijriDate {
	int year = 1;
	int month = 1; ///< 1 = Muharram ... 9 = Ramadan, 10 = Shawwal ... 12 = Dhu al-Hijjah.
	int day = 1;
};

/**
 * @class HijriConverter
 * @brief Gregorian to Hijri conversion on the 30-year tabular cycle.
 *
 * The tabular calendar may differ from sighting-based announcements by a day or two,
 * which the effect windows tolerate.
 */
class HijriConverter {
public:
	static constexpr int kMinGregorianYear = 1900;
	static constexpr int kMaxGregorianYear = 2199;

	/**
	 * @throws core::CalendarConversionError Outside Gregorian years 1900-2199.
	 */
	static HijriDate toHijri(const core::CalendarDate &date);

	/// Gregorian date of the given Hijri day. Month and day are not range-checked.
	static core::CalendarDate toGregorian(int year, int month, int day);
};

} // namespace demandcast::calendar
