#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace demandcast::core {

/**
 * @class CalendarDate
 * @brief A proleptic Gregorian civil date.
 *
 * Stored as a day count relative to 1970-01-01 so that ordering, differences and
 * day arithmetic are plain integer operations. Day-of-week follows the 0 = Sunday
 * convention used throughout the engine.
 */
class CalendarDate {
public:
	using TimePoint = std::chrono::system_clock::time_point;

	/// Constructs 1970-01-01.
	CalendarDate() = default;

	/**
	 * @brief Constructs a date from its civil fields.
	 * @throws std::invalid_argument If month or day are out of range.
	 */
	CalendarDate(int year, unsigned month, unsigned day);

	static CalendarDate fromDays(std::int64_t days_since_epoch);

	/**
	 * @brief Parses an ISO `YYYY-MM-DD` string.
	 * @throws std::invalid_argument On malformed input.
	 */
	static CalendarDate parse(const std::string &iso);

	/// Truncates a time point to its UTC calendar day.
	static CalendarDate fromTimePoint(TimePoint tp);

	/// The current UTC calendar day.
	static CalendarDate today();

	static bool isLeapYear(int year);
	static unsigned daysInMonth(int year, unsigned month);

	std::int64_t toDays() const {
		return days_;
	}

	/// Midnight UTC of this date.
	TimePoint toTimePoint() const;

	int year() const;
	unsigned month() const;
	unsigned day() const;

	/// 0 = Sunday ... 6 = Saturday.
	int dayOfWeek() const;

	bool isWeekend() const {
		const int dow = dayOfWeek();
		return dow == 0 || dow == 6;
	}

	CalendarDate addDays(std::int64_t days) const {
		return fromDays(days_ + days);
	}

	std::string toString() const;

	friend std::int64_t operator-(const CalendarDate &lhs, const CalendarDate &rhs) {
		return lhs.days_ - rhs.days_;
	}

	friend bool operator==(const CalendarDate &lhs, const CalendarDate &rhs) {
		return lhs.days_ == rhs.days_;
	}
	friend bool operator!=(const CalendarDate &lhs, const CalendarDate &rhs) {
		return lhs.days_ != rhs.days_;
	}
	friend bool operator<(const CalendarDate &lhs, const CalendarDate &rhs) {
		return lhs.days_ < rhs.days_;
	}
	friend bool operator<=(const CalendarDate &lhs, const CalendarDate &rhs) {
		return lhs.days_ <= rhs.days_;
	}
	friend bool operator>(const CalendarDate &lhs, const CalendarDate &rhs) {
		return lhs.days_ > rhs.days_;
	}
	friend bool operator>=(const CalendarDate &lhs, const CalendarDate &rhs) {
		return lhs.days_ >= rhs.days_;
	}

private:
	explicit CalendarDate(std::int64_t days) : days_(days) {}

	std::int64_t days_ = 0;
};

} // namespace demandcast::core
