#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tsforecast::core {

/**
 * @class RawTable
 * @brief Column-major table of untyped cells, as decoded from a tabular file.
 *
 * All columns have the same length. No semantic checks happen here; the
 * schema inferencer and regularizer decide what the cells mean.
 */
class RawTable {
public:
	/// A cell is missing, a number, or free text.
	using Cell = std::variant<std::monostate, double, std::string>;
	using Column = std::vector<Cell>;

	RawTable() = default;

	/**
	 * @throws std::invalid_argument If names and columns disagree in count or columns differ in length.
	 */
	RawTable(std::vector<std::string> column_names, std::vector<Column> columns);

	std::size_t columnCount() const {
		return columns_.size();
	}

	std::size_t rowCount() const {
		return columns_.empty() ? 0 : columns_.front().size();
	}

	const std::vector<std::string> &columnNames() const {
		return column_names_;
	}

	const std::string &columnName(std::size_t index) const;
	const Column &column(std::size_t index) const;

	/// Column with the given name; throws std::out_of_range when absent.
	const Column &column(const std::string &name) const;

	/// Index of the first column with the given name.
	std::optional<std::size_t> columnIndex(const std::string &name) const;

	static bool isMissing(const Cell &cell);

	/**
	 * @brief Numeric reading of a cell.
	 *
	 * Numbers are returned as is; strings must parse completely as a finite
	 * decimal number (surrounding whitespace allowed, no hex, inf or nan). Missing cells and empty strings
	 * yield std::nullopt, as does any other text.
	 */
	static std::optional<double> asNumber(const Cell &cell);

	/// Text form of a cell, used in error messages and timestamp parsing.
	static std::string toText(const Cell &cell);

private:
	std::vector<std::string> column_names_;
	std::vector<Column> columns_;
};

} // namespace tsforecast::core
