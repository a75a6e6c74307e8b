#include "tsforecast/pipeline/series_regularizer.hpp"

#include "tsforecast/core/calendar.hpp"
#include "tsforecast/core/errors.hpp"
#include "tsforecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tsforecast::pipeline {

namespace {

struct Observation {
	SeriesRegularizer::TimePoint timestamp;
	double value;
};

using core::calendar::CivilDateTime;

bool isMidnight(const CivilDateTime &civil) {
	return civil.hour == 0 && civil.minute == 0 && civil.second == 0 && civil.millisecond == 0;
}

// First day-1 midnight at or after tp (first 1 January when @p january_only).
SeriesRegularizer::TimePoint nextPeriodStart(SeriesRegularizer::TimePoint tp, bool january_only) {
	const CivilDateTime civil = core::calendar::toCivil(tp);
	if (civil.date.day == 1 && isMidnight(civil) && (!january_only || civil.date.month == 1)) {
		return tp;
	}
	CivilDateTime start;
	start.date.year = civil.date.year;
	start.date.month = january_only ? 1 : civil.date.month;
	start.date.day = 1;
	return core::calendar::addMonths(core::calendar::toTimePoint(start), january_only ? 12 : 1);
}

std::string cellPreview(const core::RawTable::Cell &cell) {
	std::string text = core::RawTable::toText(cell);
	if (text.size() > 40) {
		text = text.substr(0, 37) + "...";
	}
	return text;
}

} // namespace

SeriesRegularizer::SeriesRegularizer() : SeriesRegularizer(RegularizerOptions{}) {
}

SeriesRegularizer::SeriesRegularizer(RegularizerOptions options, FrequencyInference inference)
    : options_(options), inference_(std::move(inference)) {
}

std::optional<SeriesRegularizer::TimePoint> SeriesRegularizer::parseTimeCell(const core::RawTable::Cell &cell,
                                                                             const std::string &column,
                                                                             std::size_t row) {
	if (core::RawTable::isMissing(cell)) {
		return std::nullopt;
	}
	std::optional<TimePoint> parsed;
	if (const auto *number = std::get_if<double>(&cell)) {
		if (std::floor(*number) == *number && *number >= 1000.0 && *number <= 9999.0) {
			parsed = core::calendar::parseTimestamp(std::to_string(static_cast<int>(*number)));
		}
	} else {
		parsed = core::calendar::parseTimestamp(std::get<std::string>(cell));
	}
	if (!parsed) {
		throw core::SchemaError(core::SchemaError::Kind::UnparsableTimestamp, column,
		                        "Unable to convert column '" + column + "' to dates (row " + std::to_string(row + 1) +
		                            ": '" + cellPreview(cell) + "').");
	}
	return parsed;
}

std::vector<SeriesRegularizer::TimePoint> SeriesRegularizer::buildCalendar(TimePoint first, TimePoint last,
                                                                           core::Frequency frequency) {
	TimePoint anchor = first;
	if (frequency == core::Frequency::MonthStart) {
		anchor = nextPeriodStart(first, false);
	} else if (frequency == core::Frequency::YearStart) {
		anchor = nextPeriodStart(first, true);
	}

	std::vector<TimePoint> points;
	for (int step = 0;; ++step) {
		// Step from the anchor so month-end clamping never accumulates.
		const TimePoint tp = core::advance(anchor, frequency, step);
		if (tp > last) {
			break;
		}
		points.push_back(tp);
	}
	return points;
}

core::TimeSeries SeriesRegularizer::regularize(const core::RawTable &table, const std::string &time_column,
                                               const std::string &value_column) const {
	const auto time_index = table.columnIndex(time_column);
	if (!time_index) {
		throw core::SchemaError(core::SchemaError::Kind::MalformedInput, time_column,
		                        "Column '" + time_column + "' does not exist.");
	}
	const auto value_index = table.columnIndex(value_column);
	if (!value_index) {
		throw core::SchemaError(core::SchemaError::Kind::MalformedInput, value_column,
		                        "Column '" + value_column + "' does not exist.");
	}
	const auto &time_cells = table.column(*time_index);
	const auto &value_cells = table.column(*value_index);

	std::vector<std::optional<TimePoint>> timestamps;
	timestamps.reserve(time_cells.size());
	for (std::size_t row = 0; row < time_cells.size(); ++row) {
		timestamps.push_back(parseTimeCell(time_cells[row], time_column, row));
	}

	std::vector<std::optional<double>> values;
	values.reserve(value_cells.size());
	for (std::size_t row = 0; row < value_cells.size(); ++row) {
		const auto &cell = value_cells[row];
		if (core::RawTable::isMissing(cell)) {
			values.emplace_back();
			continue;
		}
		const auto number = core::RawTable::asNumber(cell);
		if (!number) {
			throw core::SchemaError(core::SchemaError::Kind::UnparsableNumeric, value_column,
			                        "Unable to convert column '" + value_column + "' to numeric values (row " +
			                            std::to_string(row + 1) + ": '" + cellPreview(cell) + "').");
		}
		values.push_back(number);
	}

	std::vector<Observation> observations;
	observations.reserve(timestamps.size());
	for (std::size_t row = 0; row < timestamps.size(); ++row) {
		if (timestamps[row] && values[row]) {
			observations.push_back({*timestamps[row], *values[row]});
		}
	}
	const std::size_t dropped = timestamps.size() - observations.size();

	std::stable_sort(observations.begin(), observations.end(),
	                 [](const Observation &lhs, const Observation &rhs) { return lhs.timestamp < rhs.timestamp; });
	// Equal timestamps are adjacent in read order; keep the last of each run.
	std::vector<Observation> unique;
	unique.reserve(observations.size());
	for (const auto &obs : observations) {
		if (!unique.empty() && unique.back().timestamp == obs.timestamp) {
			unique.back() = obs;
		} else {
			unique.push_back(obs);
		}
	}
	const std::size_t duplicates = observations.size() - unique.size();

	if (unique.size() < options_.min_observations) {
		throw core::InsufficientDataError(unique.size(), options_.min_observations,
		                                  "Not enough valid data after cleaning: " + std::to_string(unique.size()) +
		                                      " points, at least " + std::to_string(options_.min_observations) +
		                                      " required.");
	}
	if (dropped > 0 || duplicates > 0) {
		TSFORECAST_DEBUG("Dropped {} incomplete rows and {} duplicate timestamps.", dropped, duplicates);
	}

	std::vector<TimePoint> observed_times;
	observed_times.reserve(unique.size());
	for (const auto &obs : unique) {
		observed_times.push_back(obs.timestamp);
	}
	const FrequencyDecision decision = inference_.infer(observed_times);
	TSFORECAST_INFO("Inferred frequency '{}' from rule '{}'.", core::frequencyCode(decision.frequency), decision.rule);

	const auto calendar = buildCalendar(unique.front().timestamp, unique.back().timestamp, decision.frequency);
	if (calendar.size() < options_.min_observations) {
		throw core::InsufficientDataError(calendar.size(), options_.min_observations,
		                                  "Not enough calendar points after regularization: " +
		                                      std::to_string(calendar.size()) + " points, at least " +
		                                      std::to_string(options_.min_observations) + " required.");
	}

	std::vector<double> filled;
	filled.reserve(calendar.size());
	std::size_t cursor = 0;
	std::size_t gap_fills = 0;
	for (const auto &tp : calendar) {
		while (cursor + 1 < unique.size() && unique[cursor + 1].timestamp <= tp) {
			++cursor;
		}
		if (unique[cursor].timestamp != tp) {
			++gap_fills;
		}
		filled.push_back(unique[cursor].value);
	}
	if (gap_fills > 0) {
		TSFORECAST_DEBUG("Forward-filled {} of {} calendar points.", gap_fills, calendar.size());
	}

	core::TimeSeries series(calendar, std::move(filled), value_column, decision.frequency);
	series.setMetadata({{"time_column", time_column}, {"frequency_rule", decision.rule}});
	return series;
}

} // namespace tsforecast::pipeline
