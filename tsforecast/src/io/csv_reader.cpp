#include "tsforecast/io/csv_reader.hpp"

#include "tsforecast/core/errors.hpp"
#include "tsforecast/utils/logging.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tsforecast::io {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::string trim(const std::string &text) {
	const auto first = text.find_first_not_of(" \t");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = text.find_last_not_of(" \t");
	return text.substr(first, last - first + 1);
}

bool isBlankRecord(const std::vector<std::string> &record) {
	return record.size() == 1 && trim(record.front()).empty();
}

} // namespace

CsvReader::CsvReader() : CsvReader(Options{}) {
}

CsvReader::CsvReader(Options options) : options_(options) {
}

core::RawTable CsvReader::readFile(const std::string &path) const {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		throw std::runtime_error("Cannot open '" + path + "' for reading.");
	}
	std::ostringstream buffer;
	buffer << in.rdbuf();
	if (in.bad()) {
		throw std::runtime_error("Failed to read '" + path + "'.");
	}
	TSFORECAST_DEBUG("Read {} bytes from '{}'", buffer.str().size(), path);
	return parse(buffer.str());
}

std::vector<std::vector<std::string>> CsvReader::splitRecords(const std::string &content) const {
	std::vector<std::vector<std::string>> records;
	std::vector<std::string> record;
	std::string field;
	bool in_quotes = false;
	bool field_started = false;

	auto end_field = [&]() {
		record.push_back(std::move(field));
		field.clear();
		field_started = false;
	};
	auto end_record = [&]() {
		end_field();
		if (!(options_.skip_blank_lines && isBlankRecord(record))) {
			records.push_back(std::move(record));
		}
		record.clear();
	};

	std::size_t i = content.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0 ? kUtf8Bom.size() : 0;
	for (; i < content.size(); ++i) {
		const char ch = content[i];
		if (in_quotes) {
			if (ch == '"') {
				if (i + 1 < content.size() && content[i + 1] == '"') {
					field.push_back('"');
					++i;
				} else {
					in_quotes = false;
				}
			} else {
				field.push_back(ch);
			}
			continue;
		}

		if (ch == '"' && trim(field).empty() && !field_started) {
			field.clear();
			in_quotes = true;
			field_started = true;
		} else if (ch == options_.delimiter) {
			end_field();
		} else if (ch == '\r') {
			if (i + 1 < content.size() && content[i + 1] == '\n') {
				++i;
			}
			end_record();
		} else if (ch == '\n') {
			end_record();
		} else {
			field.push_back(ch);
		}
	}

	if (in_quotes) {
		throw core::SchemaError(core::SchemaError::Kind::MalformedInput, {},
		                        "Unterminated quoted field at end of input.");
	}
	if (!field.empty() || field_started || !record.empty()) {
		end_record();
	}
	return records;
}

core::RawTable::Cell CsvReader::toCell(const std::string &field) {
	const std::string text = trim(field);
	if (text.empty()) {
		return std::monostate{};
	}
	if (const auto number = core::RawTable::asNumber(core::RawTable::Cell{text})) {
		return *number;
	}
	return text;
}

core::RawTable CsvReader::parse(const std::string &content) const {
	auto records = splitRecords(content);
	if (records.empty()) {
		throw core::SchemaError(core::SchemaError::Kind::MalformedInput, {}, "The file contains no header row.");
	}

	std::vector<std::string> names;
	names.reserve(records.front().size());
	for (std::size_t c = 0; c < records.front().size(); ++c) {
		const std::string name = trim(records.front()[c]);
		names.push_back(name.empty() ? "Unnamed: " + std::to_string(c) : name);
	}

	std::vector<core::RawTable::Column> columns(names.size());
	for (auto &column : columns) {
		column.reserve(records.size() - 1);
	}

	for (std::size_t r = 1; r < records.size(); ++r) {
		const auto &record = records[r];
		if (record.size() > names.size()) {
			throw core::SchemaError(core::SchemaError::Kind::MalformedInput, {},
			                        "Row " + std::to_string(r) + " has " + std::to_string(record.size()) +
			                            " fields, the header has " + std::to_string(names.size()) + ".");
		}
		for (std::size_t c = 0; c < names.size(); ++c) {
			columns[c].push_back(c < record.size() ? toCell(record[c]) : core::RawTable::Cell{});
		}
	}

	TSFORECAST_DEBUG("Parsed table with {} columns and {} rows", names.size(), records.size() - 1);
	return core::RawTable(std::move(names), std::move(columns));
}

} // namespace tsforecast::io
