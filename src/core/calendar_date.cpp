#include "demand-cast/core/calendar_date.hpp"

#include <cstdio>
#include <stdexcept>

namespace demandcast::core {

namespace {

struct CivilFields {
	int year;
	unsigned month;
	unsigned day;
};

// Howard Hinnant's days_from_civil / civil_from_days, valid over the full int range.
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilFields civilFromDays(std::int64_t z) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return {static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

} // namespace

CalendarDate::CalendarDate(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be between 1 and 12.");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day is out of range for the given month.");
	}
	days_ = daysFromCivil(year, month, day);
}

CalendarDate CalendarDate::fromDays(std::int64_t days_since_epoch) {
	return CalendarDate(days_since_epoch);
}

CalendarDate CalendarDate::parse(const std::string &iso) {
	int year = 0;
	unsigned month = 0;
	unsigned day = 0;
	char trailing = '\0';
	if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-' ||
	    std::sscanf(iso.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &trailing) != 3) {
		throw std::invalid_argument("Expected an ISO date (YYYY-MM-DD), got '" + iso + "'.");
	}
	return CalendarDate(year, month, day);
}

CalendarDate CalendarDate::fromTimePoint(TimePoint tp) {
	const auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	std::int64_t days = since_epoch / 86400;
	if (since_epoch % 86400 < 0) {
		--days;
	}
	return CalendarDate(days);
}

CalendarDate CalendarDate::today() {
	return fromTimePoint(std::chrono::system_clock::now());
}

bool CalendarDate::isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned CalendarDate::daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be between 1 and 12.");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

CalendarDate::TimePoint CalendarDate::toTimePoint() const {
	return TimePoint{} + std::chrono::seconds(days_ * 86400);
}

int CalendarDate::year() const {
	return civilFromDays(days_).year;
}

unsigned CalendarDate::month() const {
	return civilFromDays(days_).month;
}

unsigned CalendarDate::day() const {
	return civilFromDays(days_).day;
}

int CalendarDate::dayOfWeek() const {
	// 1970-01-01 was a Thursday.
	return static_cast<int>(days_ >= -4 ? (days_ + 4) % 7 : (days_ + 5) % 7 + 6);
}

std::string CalendarDate::toString() const {
	const auto fields = civilFromDays(days_);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", fields.year, fields.month, fields.day);
	return buffer;
}

} // namespace demandcast::core
