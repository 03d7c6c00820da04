#pragma once

#include <stdexcept>
#include <string>

namespace demandcast::core {

/// Raised when a requested date range is empty (start after end).
class InvalidRangeError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/// Raised for non-monotonic or duplicate dates, or negative / non-finite demand values.
class MalformedSeriesError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/// Raised when a Gregorian date is outside the supported Hijri conversion range.
class CalendarConversionError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @brief Tags a result with whether it was computed from enough data.
 *
 * Thin inputs never abort a computation. The component takes its documented
 * fallback and marks the result as InsufficientData instead.
 */
enum class DataStatus {
	Sufficient,
	InsufficientData
};

inline std::string toString(DataStatus status) {
	return status == DataStatus::Sufficient ? "sufficient" : "insufficient_data";
}

} // namespace demandcast::core
