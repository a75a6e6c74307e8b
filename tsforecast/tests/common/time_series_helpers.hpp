#pragma once

#include "tsforecast/core/calendar.hpp"
#include "tsforecast/core/frequency.hpp"
#include "tsforecast/core/raw_table.hpp"
#include "tsforecast/core/time_series.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

namespace tests::helpers {

using TimePoint = tsforecast::core::TimeSeries::TimePoint;

inline TimePoint date(int year, int month, int day, int hour = 0, int minute = 0) {
	tsforecast::core::calendar::CivilDateTime value;
	value.date = {year, month, day};
	value.hour = hour;
	value.minute = minute;
	return tsforecast::core::calendar::toTimePoint(value);
}

inline std::vector<TimePoint> makeTimestamps(TimePoint start, std::size_t count,
                                             tsforecast::core::Frequency frequency) {
	std::vector<TimePoint> timestamps;
	timestamps.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		timestamps.push_back(tsforecast::core::advance(start, frequency, static_cast<int>(i)));
	}
	return timestamps;
}

inline tsforecast::core::TimeSeries makeSeries(std::vector<double> values, TimePoint start,
                                               tsforecast::core::Frequency frequency,
                                               const std::string &label = "value") {
	auto timestamps = makeTimestamps(start, values.size(), frequency);
	return tsforecast::core::TimeSeries(std::move(timestamps), std::move(values), label, frequency);
}

inline tsforecast::core::TimeSeries makeMonthlySeries(std::vector<double> values) {
	return makeSeries(std::move(values), date(1949, 1, 1), tsforecast::core::Frequency::MonthStart);
}

inline tsforecast::core::TimeSeries makeDailySeries(std::vector<double> values) {
	return makeSeries(std::move(values), date(2024, 1, 1), tsforecast::core::Frequency::Daily);
}

// Deterministic noise in [-0.5, 0.5).
inline double hashNoise(std::size_t i) {
	const double v = std::sin(static_cast<double>(i) * 12.9898) * 43758.5453;
	return v - std::floor(v) - 0.5;
}

// Trend plus a sine season plus hashNoise.
inline std::vector<double> seasonalValues(std::size_t count, int period = 12, double amplitude = 10.0,
                                          double slope = 0.5, double noise = 2.0) {
	constexpr double kTwoPi = 6.283185307179586;
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t t = 0; t < count; ++t) {
		const double x = static_cast<double>(t);
		values.push_back(100.0 + slope * x + amplitude * std::sin(kTwoPi * x / static_cast<double>(period)) +
		                 noise * hashNoise(t));
	}
	return values;
}

// Drifting oscillation used for short daily series.
inline std::vector<double> dailyValues(std::size_t count) {
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t t = 0; t < count; ++t) {
		const double x = static_cast<double>(t);
		values.push_back(50.0 + 0.5 * x + 3.0 * std::sin(x / 2.0) + 2.0 * hashNoise(t));
	}
	return values;
}

// Monthly totals of international airline passengers, 1949-1960.
inline std::vector<double> airPassengers() {
	return {112., 118., 132., 129., 121., 135., 148., 148., 136., 119., 104., 118., 115., 126., 141., 135., 125.,
	        149., 170., 170., 158., 133., 114., 140., 145., 150., 178., 163., 172., 178., 199., 199., 184., 162.,
	        146., 166., 171., 180., 193., 181., 183., 218., 230., 242., 209., 191., 172., 194., 196., 196., 236.,
	        235., 229., 243., 264., 272., 237., 211., 180., 201., 204., 188., 235., 227., 234., 264., 302., 293.,
	        259., 229., 203., 229., 242., 233., 267., 269., 270., 315., 364., 347., 312., 274., 237., 278., 284.,
	        277., 317., 313., 318., 374., 413., 405., 355., 306., 271., 306., 315., 301., 356., 348., 355., 422.,
	        465., 467., 404., 347., 305., 336., 340., 318., 362., 348., 363., 435., 491., 505., 404., 359., 310.,
	        337., 360., 342., 406., 396., 420., 472., 548., 559., 463., 407., 362., 405., 417., 391., 419., 461.,
	        472., 535., 622., 606., 508., 461., 390., 432.};
}

inline tsforecast::core::RawTable::Column textColumn(const std::vector<std::string> &cells) {
	tsforecast::core::RawTable::Column column;
	column.reserve(cells.size());
	for (const auto &cell : cells) {
		column.emplace_back(cell);
	}
	return column;
}

inline tsforecast::core::RawTable::Column numberColumn(const std::vector<double> &cells) {
	tsforecast::core::RawTable::Column column;
	column.reserve(cells.size());
	for (double cell : cells) {
		column.emplace_back(cell);
	}
	return column;
}

// "YYYY-MM-DD" labels of consecutive calendar points.
inline std::vector<std::string> dateLabels(TimePoint start, std::size_t count, tsforecast::core::Frequency frequency,
                                           const std::string &format = "%Y-%m-%d") {
	std::vector<std::string> labels;
	labels.reserve(count);
	for (const auto &tp : makeTimestamps(start, count, frequency)) {
		labels.push_back(tsforecast::core::calendar::formatTimestamp(tp, format));
	}
	return labels;
}

inline tsforecast::core::RawTable makeTable(const std::vector<std::string> &names,
                                            std::vector<tsforecast::core::RawTable::Column> columns) {
	return tsforecast::core::RawTable(names, std::move(columns));
}

// Two-column (Date, Value) table of consecutive calendar points.
inline tsforecast::core::RawTable makeDateValueTable(const std::vector<double> &values, TimePoint start,
                                                     tsforecast::core::Frequency frequency,
                                                     const std::string &date_name = "Date",
                                                     const std::string &value_name = "Value") {
	return makeTable({date_name, value_name},
	                 {textColumn(dateLabels(start, values.size(), frequency)), numberColumn(values)});
}

} // namespace tests::helpers
