#include "tsforecast/core/raw_table.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace tsforecast::core {

namespace {

std::string trimmed(const std::string &text) {
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

} // namespace

RawTable::RawTable(std::vector<std::string> column_names, std::vector<Column> columns)
    : column_names_(std::move(column_names)), columns_(std::move(columns)) {
	if (column_names_.size() != columns_.size()) {
		throw std::invalid_argument("RawTable requires one name per column.");
	}
	for (std::size_t i = 1; i < columns_.size(); ++i) {
		if (columns_[i].size() != columns_.front().size()) {
			throw std::invalid_argument("RawTable column '" + column_names_[i] +
			                            "' length does not match the first column.");
		}
	}
}

const std::string &RawTable::columnName(std::size_t index) const {
	if (index >= column_names_.size()) {
		throw std::out_of_range("RawTable column index out of range.");
	}
	return column_names_[index];
}

const RawTable::Column &RawTable::column(std::size_t index) const {
	if (index >= columns_.size()) {
		throw std::out_of_range("RawTable column index out of range.");
	}
	return columns_[index];
}

const RawTable::Column &RawTable::column(const std::string &name) const {
	const auto index = columnIndex(name);
	if (!index) {
		throw std::out_of_range("RawTable has no column named '" + name + "'.");
	}
	return columns_[*index];
}

std::optional<std::size_t> RawTable::columnIndex(const std::string &name) const {
	for (std::size_t i = 0; i < column_names_.size(); ++i) {
		if (column_names_[i] == name) {
			return i;
		}
	}
	return std::nullopt;
}

bool RawTable::isMissing(const Cell &cell) {
	if (std::holds_alternative<std::monostate>(cell)) {
		return true;
	}
	if (const auto *text = std::get_if<std::string>(&cell)) {
		return trimmed(*text).empty();
	}
	return std::isnan(std::get<double>(cell));
}

std::optional<double> RawTable::asNumber(const Cell &cell) {
	if (const auto *number = std::get_if<double>(&cell)) {
		if (std::isnan(*number)) {
			return std::nullopt;
		}
		return *number;
	}
	const auto *text = std::get_if<std::string>(&cell);
	if (!text) {
		return std::nullopt;
	}
	const std::string value = trimmed(*text);
	if (value.empty()) {
		return std::nullopt;
	}
	// Decimal notation only: strtod would also take hex, "inf" and "nan".
	const bool decimal = std::all_of(value.begin(), value.end(), [](char ch) {
		return std::isdigit(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.' || ch == 'e' ||
		       ch == 'E';
	});
	if (!decimal) {
		return std::nullopt;
	}
	errno = 0;
	char *end = nullptr;
	const double parsed = std::strtod(value.c_str(), &end);
	if (end != value.c_str() + value.size() || errno == ERANGE || !std::isfinite(parsed)) {
		return std::nullopt;
	}
	return parsed;
}

std::string RawTable::toText(const Cell &cell) {
	if (std::holds_alternative<std::monostate>(cell)) {
		return {};
	}
	if (const auto *text = std::get_if<std::string>(&cell)) {
		return *text;
	}
	std::ostringstream out;
	out.precision(15);
	out << std::get<double>(cell);
	return out.str();
}

} // namespace tsforecast::core
