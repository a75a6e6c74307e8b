#pragma once

#include "tsforecast/core/raw_table.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tsforecast::pipeline {

/// Columns chosen as the time axis and the numeric signal.
struct SchemaChoice {
	std::string time_column;
	std::string value_column;
};

/**
 * @class SchemaInferencer
 * @brief Picks the time and value columns of an arbitrary table by heuristics.
 *
 * The time column is the last column whose name contains one of the time
 * keywords (case-insensitive); without a match it is the first column. The
 * value column is the first other column whose cells are all numeric; without
 * one it is the second column. The choice is a guess: the regularizer is the
 * component that rejects columns which do not convert.
 */
class SchemaInferencer {
public:
	struct Options {
		std::vector<std::string> time_keywords = {"date", "time", "month", "year", "day"};
		std::size_t min_columns = 2;
		std::size_t min_rows = 10;
	};

	SchemaInferencer();
	explicit SchemaInferencer(Options options);

	/**
	 * @throws core::SchemaError With kind TooFewColumns for fewer than min_columns columns.
	 * @throws core::InsufficientDataError For fewer than min_rows rows.
	 */
	SchemaChoice infer(const core::RawTable &table) const;

	bool matchesTimeKeyword(const std::string &column_name) const;

	/// True when the column has at least one value and every non-missing cell reads as a number.
	static bool isNumericColumn(const core::RawTable::Column &column);

private:
	Options options_;
};

} // namespace tsforecast::pipeline
