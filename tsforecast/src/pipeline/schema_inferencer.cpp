#include "tsforecast/pipeline/schema_inferencer.hpp"

#include "tsforecast/core/errors.hpp"
#include "tsforecast/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

namespace tsforecast::pipeline {

namespace {

std::string toLower(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

} // namespace

SchemaInferencer::SchemaInferencer() : SchemaInferencer(Options{}) {
}

SchemaInferencer::SchemaInferencer(Options options) : options_(std::move(options)) {
	for (auto &keyword : options_.time_keywords) {
		keyword = toLower(keyword);
	}
}

bool SchemaInferencer::matchesTimeKeyword(const std::string &column_name) const {
	const std::string lowered = toLower(column_name);
	return std::any_of(options_.time_keywords.begin(), options_.time_keywords.end(),
	                   [&](const std::string &keyword) { return lowered.find(keyword) != std::string::npos; });
}

bool SchemaInferencer::isNumericColumn(const core::RawTable::Column &column) {
	bool any_value = false;
	for (const auto &cell : column) {
		if (core::RawTable::isMissing(cell)) {
			continue;
		}
		if (!core::RawTable::asNumber(cell)) {
			return false;
		}
		any_value = true;
	}
	return any_value;
}

SchemaChoice SchemaInferencer::infer(const core::RawTable &table) const {
	if (table.columnCount() < options_.min_columns) {
		throw core::SchemaError(core::SchemaError::Kind::TooFewColumns, {},
		                        "The table must contain at least " + std::to_string(options_.min_columns) +
		                            " columns (date, value); found " + std::to_string(table.columnCount()) + ".");
	}
	if (table.rowCount() < options_.min_rows) {
		throw core::InsufficientDataError(table.rowCount(), options_.min_rows,
		                                  "The table must contain at least " + std::to_string(options_.min_rows) +
		                                      " rows of data; found " + std::to_string(table.rowCount()) + ".");
	}

	std::optional<std::size_t> time_index;
	std::optional<std::size_t> value_index;
	for (std::size_t i = 0; i < table.columnCount(); ++i) {
		if (matchesTimeKeyword(table.columnName(i))) {
			time_index = i;
		} else if (!value_index && isNumericColumn(table.column(i))) {
			value_index = i;
		}
	}

	SchemaChoice choice;
	choice.time_column = table.columnName(time_index.value_or(0));
	choice.value_column = table.columnName(value_index.value_or(1));
	TSFORECAST_INFO("Schema inferred: time column '{}'{}, value column '{}'{}.", choice.time_column,
	                time_index ? "" : " (fallback)", choice.value_column, value_index ? "" : " (fallback)");
	return choice;
}

} // namespace tsforecast::pipeline
