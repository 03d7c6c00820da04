#include "demand-cast/calendar/islamic_window_table.hpp"
#include "demand-cast/utils/logging.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace demandcast::calendar {

namespace {

std::string trim(const std::string &text) {
	const auto first = text.find_first_not_of(" \t\r\n\"");
	if (first == std::string::npos) {
		return "";
	}
	const auto last = text.find_last_not_of(" \t\r\n\"");
	return text.substr(first, last - first + 1);
}

std::vector<std::string> splitCells(const std::string &line) {
	std::vector<std::string> cells;
	std::stringstream ss(line);
	std::string cell;
	while (std::getline(ss, cell, ',')) {
		cells.push_back(trim(cell));
	}
	return cells;
}

std::invalid_argument lineError(std::size_t line_no, const std::string &what) {
	return std::invalid_argument("Islamic window table, line " + std::to_string(line_no) + ": " + what);
}

} // namespace

IslamicWindowTable IslamicWindowTable::parse(std::istream &input) {
	IslamicWindowTable table;
	std::string line;
	std::size_t line_no = 0;
	bool header_seen = false;

	while (std::getline(input, line)) {
		++line_no;
		const std::string content = trim(line);
		if (content.empty()) {
			continue;
		}
		if (content.front() == '#') {
			const std::string tag = "version:";
			const auto pos = content.find(tag);
			if (pos != std::string::npos) {
				table.version_ = trim(content.substr(pos + tag.size()));
			}
			continue;
		}

		const auto cells = splitCells(content);
		if (!header_seen) {
			header_seen = true;
			if (!cells.empty() && cells.front() == "year") {
				if (cells.size() != 5) {
					throw lineError(line_no, "expected 5 header columns.");
				}
				continue;
			}
		}
		if (cells.size() != 5) {
			throw lineError(line_no, "expected 5 columns, got " + std::to_string(cells.size()) + ".");
		}

		int year = 0;
		IslamicWindows windows;
		try {
			std::size_t consumed = 0;
			year = std::stoi(cells[0], &consumed);
			if (consumed != cells[0].size()) {
				throw std::invalid_argument("trailing characters in year");
			}
			windows.ramadan_start = core::CalendarDate::parse(cells[1]);
			windows.ramadan_end = core::CalendarDate::parse(cells[2]);
			windows.lebaran_start = core::CalendarDate::parse(cells[3]);
			windows.lebaran_end = core::CalendarDate::parse(cells[4]);
		} catch (const std::exception &ex) {
			throw lineError(line_no, ex.what());
		}

		if (windows.ramadan_end < windows.ramadan_start || windows.lebaran_end < windows.lebaran_start) {
			throw lineError(line_no, "window ends before it starts.");
		}
		table.add(year, windows);
	}

	DEMANDCAST_DEBUG("Loaded {} Islamic calendar windows (version '{}').", table.size(), table.version_);
	return table;
}

IslamicWindowTable IslamicWindowTable::fromFile(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Cannot open Islamic window table: " + path);
	}
	return parse(file);
}

void IslamicWindowTable::add(int year, const IslamicWindows &windows) {
	entries_[year] = windows;
}

std::optional<IslamicWindows> IslamicWindowTable::find(int year) const {
	const auto it = entries_.find(year);
	if (it == entries_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<IslamicWindows> IslamicWindowTable::ramadanContaining(const core::CalendarDate &date) const {
	for (const auto &entry : entries_) {
		const auto &w = entry.second;
		if (date >= w.ramadan_start && date <= w.ramadan_end) {
			return w;
		}
	}
	return std::nullopt;
}

std::optional<IslamicWindows> IslamicWindowTable::lebaranContaining(const core::CalendarDate &date) const {
	for (const auto &entry : entries_) {
		const auto &w = entry.second;
		if (date >= w.lebaran_start && date <= w.lebaran_end) {
			return w;
		}
	}
	return std::nullopt;
}

} // namespace demandcast::calendar
