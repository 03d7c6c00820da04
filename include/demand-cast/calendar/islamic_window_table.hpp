#pragma once

#include "demand-cast/core/calendar_date.hpp"

#include <iosfwd>
#include <map>
#include <optional>
#include <string>

namespace demandcast::calendar {

/**
 * @struct IslamicWindows
 * @brief Approximate Ramadan and Lebaran date ranges for one Gregorian year (inclusive bounds).
 */
struct IslamicWindows {
	core::CalendarDate ramadan_start;
	core::CalendarDate ramadan_end;
	core::CalendarDate lebaran_start;
	core::CalendarDate lebaran_end;
};

/**
 * @class IslamicWindowTable
 * @brief Versioned lookup of Ramadan/Lebaran windows, used when Hijri conversion is unavailable.
 *
 * The table is data, loaded from CSV:
 * @code
 * # version: 2025.1
 * year,ramadan_start,ramadan_end,lebaran_start,lebaran_end
 * 2025,2025-02-28,2025-03-29,2025-03-30,2025-04-05
 * @endcode
 * Blank lines and lines starting with '#' other than the version header are ignored.
 * A default-constructed table is empty and carries no version.
 */
class IslamicWindowTable {
public:
	IslamicWindowTable() = default;

	/**
	 * @throws std::invalid_argument On a malformed line (the message names the line number).
	 */
	static IslamicWindowTable parse(std::istream &input);

	/**
	 * @throws std::runtime_error If the file cannot be opened.
	 * @throws std::invalid_argument On malformed content.
	 */
	static IslamicWindowTable fromFile(const std::string &path);

	/// Adds or replaces the entry for @p year.
	void add(int year, const IslamicWindows &windows);

	std::optional<IslamicWindows> find(int year) const;

	/// The Ramadan window containing @p date, if any entry has one.
	std::optional<IslamicWindows> ramadanContaining(const core::CalendarDate &date) const;

	/// The Lebaran window containing @p date, if any entry has one.
	std::optional<IslamicWindows> lebaranContaining(const core::CalendarDate &date) const;

	const std::string &version() const {
		return version_;
	}

	std::size_t size() const {
		return entries_.size();
	}

	bool empty() const {
		return entries_.empty();
	}

private:
	std::string version_;
	std::map<int, IslamicWindows> entries_;
};

} // namespace demandcast::calendar
