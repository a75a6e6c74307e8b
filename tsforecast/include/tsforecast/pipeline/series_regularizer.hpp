#pragma once

#include "tsforecast/core/raw_table.hpp"
#include "tsforecast/core/time_series.hpp"
#include "tsforecast/pipeline/frequency_inference.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tsforecast::pipeline {

struct RegularizerOptions {
	/// Rows required after cleaning and again after reindexing.
	std::size_t min_observations = 10;
};

/**
 * @class SeriesRegularizer
 * @brief Turns two table columns into a gap-free series on a fixed calendar.
 *
 * Cells are converted, rows with a missing timestamp or value are dropped,
 * the rows are sorted (a repeated timestamp keeps the row read last), the
 * frequency is inferred and the series is reindexed onto the calendar of that
 * frequency between the first and last observation. Calendar points without
 * an observation take the last known value (forward fill only).
 */
class SeriesRegularizer {
public:
	using TimePoint = core::TimeSeries::TimePoint;

	SeriesRegularizer();
	explicit SeriesRegularizer(RegularizerOptions options, FrequencyInference inference = FrequencyInference());

	/**
	 * @throws core::SchemaError If a column is absent or a non-empty cell does not convert.
	 * @throws core::InsufficientDataError If too few rows survive cleaning or reindexing.
	 */
	core::TimeSeries regularize(const core::RawTable &table, const std::string &time_column,
	                            const std::string &value_column) const;

	/**
	 * @brief Timestamp of a cell: std::nullopt when missing.
	 *
	 * Text goes through calendar::parseTimestamp. A number is accepted only as
	 * an integral year in [1000, 9999].
	 * @throws core::SchemaError For a non-empty cell that is not a timestamp.
	 */
	static std::optional<TimePoint> parseTimeCell(const core::RawTable::Cell &cell, const std::string &column,
	                                              std::size_t row);

	/// Calendar points of @p frequency anchored inside [first, last].
	static std::vector<TimePoint> buildCalendar(TimePoint first, TimePoint last, core::Frequency frequency);

private:
	RegularizerOptions options_;
	FrequencyInference inference_;
};

} // namespace tsforecast::pipeline
