#include "tsforecast/core/frequency.hpp"

#include <stdexcept>

namespace tsforecast::core {

std::string frequencyCode(Frequency frequency) {
	switch (frequency) {
	case Frequency::Daily:
		return "D";
	case Frequency::Weekly:
		return "W";
	case Frequency::MonthStart:
		return "MS";
	case Frequency::YearStart:
		return "YS";
	}
	throw std::invalid_argument("Unknown frequency.");
}

std::optional<Frequency> frequencyFromCode(const std::string &code) {
	if (code == "D") {
		return Frequency::Daily;
	}
	if (code == "W") {
		return Frequency::Weekly;
	}
	if (code == "MS") {
		return Frequency::MonthStart;
	}
	if (code == "YS") {
		return Frequency::YearStart;
	}
	return std::nullopt;
}

calendar::TimePoint advance(const calendar::TimePoint &tp, Frequency frequency, int steps) {
	switch (frequency) {
	case Frequency::Daily:
		return calendar::addDays(tp, steps);
	case Frequency::Weekly:
		return calendar::addDays(tp, std::int64_t{7} * steps);
	case Frequency::MonthStart:
		return calendar::addMonths(tp, steps);
	case Frequency::YearStart:
		return calendar::addYears(tp, steps);
	}
	throw std::invalid_argument("Unknown frequency.");
}

} // namespace tsforecast::core
