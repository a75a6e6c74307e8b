#include "tsforecast/core/calendar.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace tsforecast::core::calendar {

namespace {

namespace bg = boost::gregorian;
namespace bpt = boost::posix_time;

const bpt::ptime kEpoch{bg::date(1970, 1, 1)};

// Years boost::gregorian::date can represent.
constexpr int kMinGregorianYear = 1400;
constexpr int kMaxGregorianYear = 9999;

bg::date makeDate(int year, int month, int day) {
	return bg::date(static_cast<unsigned short>(year), static_cast<unsigned short>(month),
	                static_cast<unsigned short>(day));
}

bool validDate(const CivilDate &date) {
	if (date.year < kMinGregorianYear || date.year > kMaxGregorianYear || date.month < 1 || date.month > 12) {
		return false;
	}
	return date.day >= 1 && date.day <= daysInMonth(date.year, date.month);
}

bpt::ptime toPosixTime(const TimePoint &tp) {
	const auto ms = std::chrono::floor<std::chrono::milliseconds>(tp.time_since_epoch()).count();
	return kEpoch + bpt::milliseconds(ms);
}

// std::nullopt when @p value does not fit a TimePoint.
std::optional<TimePoint> tryFromPosixTime(const bpt::ptime &value) {
	if (value.is_special()) {
		return std::nullopt;
	}
	const auto min_ms = std::chrono::ceil<std::chrono::milliseconds>(TimePoint::min().time_since_epoch()).count();
	const auto max_ms = std::chrono::floor<std::chrono::milliseconds>(TimePoint::max().time_since_epoch()).count();
	const std::int64_t ms = (value - kEpoch).total_milliseconds();
	if (ms < min_ms || ms > max_ms) {
		return std::nullopt;
	}
	return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

TimePoint fromPosixTime(const bpt::ptime &value) {
	const auto tp = tryFromPosixTime(value);
	if (!tp) {
		throw std::invalid_argument("Timestamp " + bpt::to_iso_extended_string(value) +
		                            " is outside the supported date range.");
	}
	return *tp;
}

// Moves @p value into the month of @p target_month_start, clamping the day and keeping the time of day.
TimePoint shiftMonths(const bpt::ptime &value, const bg::date &target_month_start) {
	const bg::date source = value.date();
	const int target_year = static_cast<int>(target_month_start.year());
	const int target_month = static_cast<int>(target_month_start.month());
	const int day = std::min(static_cast<int>(source.day()), daysInMonth(target_year, target_month));
	return fromPosixTime(bpt::ptime(makeDate(target_year, target_month, day), value.time_of_day()));
}

bg::date monthStart(const bg::date &date) {
	return makeDate(static_cast<int>(date.year()), static_cast<int>(date.month()), 1);
}

void checkMonthShift(const bg::date &date, std::int64_t months) {
	const std::int64_t target =
	    static_cast<std::int64_t>(date.year()) * 12 + (static_cast<int>(date.month()) - 1) + months;
	if (target < std::int64_t{kMinGregorianYear} * 12 || target >= (std::int64_t{kMaxGregorianYear} + 1) * 12) {
		throw std::invalid_argument("Shifting " + bg::to_iso_extended_string(date) + " by " + std::to_string(months) +
		                            " months leaves the supported date range.");
	}
}

std::string trim(const std::string &text) {
	std::size_t begin = 0;
	while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
		++begin;
	}
	std::size_t end = text.size();
	while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
		--end;
	}
	return text.substr(begin, end - begin);
}

// Reads exactly @p width digits at @p pos.
bool readDigits(const std::string &text, std::size_t &pos, std::size_t width, int &out) {
	if (pos + width > text.size()) {
		return false;
	}
	int value = 0;
	for (std::size_t i = 0; i < width; ++i) {
		const char ch = text[pos + i];
		if (!std::isdigit(static_cast<unsigned char>(ch))) {
			return false;
		}
		value = value * 10 + (ch - '0');
	}
	pos += width;
	out = value;
	return true;
}

// One or two digits.
bool readShortNumber(const std::string &text, std::size_t &pos, int &out) {
	if (readDigits(text, pos, 2, out)) {
		return true;
	}
	return readDigits(text, pos, 1, out);
}

bool parseDate(const std::string &text, std::size_t &pos, CivilDate &out) {
	if (readDigits(text, pos, 4, out.year)) {
		if (pos < text.size() && (text[pos] == '-' || text[pos] == '/')) {
			const char separator = text[pos++];
			if (!readShortNumber(text, pos, out.month)) {
				return false;
			}
			if (pos < text.size() && text[pos] == separator) {
				++pos;
				if (!readShortNumber(text, pos, out.day)) {
					return false;
				}
			}
		}
		return true;
	}
	// MM/DD/YYYY
	pos = 0;
	if (!readShortNumber(text, pos, out.month) || pos >= text.size() || text[pos] != '/') {
		return false;
	}
	++pos;
	if (!readShortNumber(text, pos, out.day) || pos >= text.size() || text[pos] != '/') {
		return false;
	}
	++pos;
	return readDigits(text, pos, 4, out.year);
}

bool parseTime(const std::string &text, std::size_t &pos, bpt::time_duration &out) {
	int hour = 0;
	int minute = 0;
	int second = 0;
	int millisecond = 0;
	if (!readShortNumber(text, pos, hour) || pos >= text.size() || text[pos] != ':') {
		return false;
	}
	++pos;
	if (!readDigits(text, pos, 2, minute)) {
		return false;
	}
	if (pos < text.size() && text[pos] == ':') {
		++pos;
		if (!readDigits(text, pos, 2, second)) {
			return false;
		}
		if (pos < text.size() && text[pos] == '.') {
			++pos;
			const std::size_t start = pos;
			int digits = 0;
			while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
				if (digits < 3) {
					millisecond = millisecond * 10 + (text[pos] - '0');
					++digits;
				}
				++pos;
			}
			if (pos == start) {
				return false;
			}
			for (; digits < 3; ++digits) {
				millisecond *= 10;
			}
		}
	}
	if (hour >= 24 || minute >= 60 || second >= 60) {
		return false;
	}
	out = bpt::hours(hour) + bpt::minutes(minute) + bpt::seconds(second) + bpt::milliseconds(millisecond);
	return true;
}

// 'Z', +HH:MM, -HH:MM, +HHMM or +HH. The result is the amount to subtract to reach UTC.
bool parseUtcOffset(const std::string &text, std::size_t &pos, bpt::time_duration &out) {
	if (text[pos] == 'Z') {
		++pos;
		out = bpt::time_duration(0, 0, 0);
		return true;
	}
	if (text[pos] != '+' && text[pos] != '-') {
		return false;
	}
	const bool negative = text[pos++] == '-';
	int hours = 0;
	int minutes = 0;
	if (!readDigits(text, pos, 2, hours)) {
		return false;
	}
	if (pos < text.size() && text[pos] == ':') {
		++pos;
		if (!readDigits(text, pos, 2, minutes)) {
			return false;
		}
	} else if (pos < text.size()) {
		if (!readDigits(text, pos, 2, minutes)) {
			return false;
		}
	}
	if (hours >= 24 || minutes >= 60) {
		return false;
	}
	out = bpt::hours(hours) + bpt::minutes(minutes);
	if (negative) {
		out = out.invert_sign();
	}
	return true;
}

} // namespace

bool isLeapYear(int year) {
	return bg::gregorian_calendar::is_leap_year(static_cast<unsigned short>(year));
}

int daysInMonth(int year, int month) {
	if (month < 1 || month > 12) {
		throw std::out_of_range("Month " + std::to_string(month) + " is out of range.");
	}
	return bg::gregorian_calendar::end_of_month_day(static_cast<unsigned short>(year),
	                                                static_cast<unsigned short>(month));
}

std::int64_t daysFromCivil(const CivilDate &date) {
	return (makeDate(date.year, date.month, date.day) - kEpoch.date()).days();
}

CivilDate civilFromDays(std::int64_t days) {
	const bg::date date = kEpoch.date() + bg::days(static_cast<long>(days));
	CivilDate out;
	out.year = static_cast<int>(date.year());
	out.month = static_cast<int>(date.month());
	out.day = static_cast<int>(date.day());
	return out;
}

TimePoint toTimePoint(const CivilDateTime &value) {
	if (!validDate(value.date)) {
		throw std::invalid_argument("Invalid calendar date " + std::to_string(value.date.year) + "-" +
		                            std::to_string(value.date.month) + "-" + std::to_string(value.date.day) + ".");
	}
	const bpt::time_duration time_of_day = bpt::hours(value.hour) + bpt::minutes(value.minute) +
	                                       bpt::seconds(value.second) + bpt::milliseconds(value.millisecond);
	return fromPosixTime(bpt::ptime(makeDate(value.date.year, value.date.month, value.date.day), time_of_day));
}

CivilDateTime toCivil(const TimePoint &tp) {
	const bpt::ptime value = toPosixTime(tp);
	const bpt::time_duration time_of_day = value.time_of_day();
	CivilDateTime out;
	out.date.year = static_cast<int>(value.date().year());
	out.date.month = static_cast<int>(value.date().month());
	out.date.day = static_cast<int>(value.date().day());
	out.hour = static_cast<int>(time_of_day.hours());
	out.minute = static_cast<int>(time_of_day.minutes());
	out.second = static_cast<int>(time_of_day.seconds());
	out.millisecond = static_cast<int>(time_of_day.total_milliseconds() % 1000);
	return out;
}

TimePoint startOfDay(const TimePoint &tp) {
	return fromPosixTime(bpt::ptime(toPosixTime(tp).date()));
}

TimePoint addDays(const TimePoint &tp, std::int64_t days) {
	// Wider than the whole TimePoint range, so larger shifts cannot land inside it.
	constexpr std::int64_t kMaxDayShift = 250000;
	if (days > kMaxDayShift || days < -kMaxDayShift) {
		throw std::invalid_argument("Shifting by " + std::to_string(days) + " days leaves the supported date range.");
	}
	return fromPosixTime(toPosixTime(tp) + bg::days(static_cast<long>(days)));
}

TimePoint addMonths(const TimePoint &tp, int months) {
	const bpt::ptime value = toPosixTime(tp);
	checkMonthShift(value.date(), months);
	return shiftMonths(value, monthStart(value.date()) + bg::months(months));
}

TimePoint addYears(const TimePoint &tp, int years) {
	const bpt::ptime value = toPosixTime(tp);
	checkMonthShift(value.date(), std::int64_t{years} * 12);
	return shiftMonths(value, monthStart(value.date()) + bg::years(years));
}

std::optional<TimePoint> parseTimestamp(const std::string &raw) {
	const std::string text = trim(raw);
	if (text.empty()) {
		return std::nullopt;
	}

	CivilDate date;
	std::size_t pos = 0;
	if (!parseDate(text, pos, date) || !validDate(date)) {
		return std::nullopt;
	}
	bpt::ptime value(makeDate(date.year, date.month, date.day));

	if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
		++pos;
		bpt::time_duration time_of_day;
		if (!parseTime(text, pos, time_of_day)) {
			return std::nullopt;
		}
		value += time_of_day;
		if (pos < text.size()) {
			bpt::time_duration offset;
			if (!parseUtcOffset(text, pos, offset)) {
				return std::nullopt;
			}
			value -= offset;
		}
	}
	if (pos != text.size()) {
		return std::nullopt;
	}
	return tryFromPosixTime(value);
}

std::string formatTimestamp(const TimePoint &tp, const std::string &format) {
	const std::tm tm = bpt::to_tm(toPosixTime(tp));
	std::array<char, 128> buffer{};
	const std::size_t written = std::strftime(buffer.data(), buffer.size(), format.c_str(), &tm);
	if (written == 0 && !format.empty()) {
		throw std::invalid_argument("Timestamp format '" + format + "' produced no output.");
	}
	return std::string(buffer.data(), written);
}

std::string toIsoString(const TimePoint &tp) {
	return formatTimestamp(tp, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace tsforecast::core::calendar
