#pragma once

#include "tsforecast/core/raw_table.hpp"

#include <string>
#include <vector>

namespace tsforecast::io {

/**
 * @class CsvReader
 * @brief Decodes delimited text into a RawTable.
 *
 * The first record is the header. Fields may be quoted with '"' (a doubled
 * quote is a literal quote, quoted fields may span lines). A UTF-8 byte order
 * mark and CRLF line endings are accepted. Empty fields become missing cells,
 * fields that read completely as a number become numbers and everything else
 * stays text. Rows shorter than the header are padded with missing cells.
 */
class CsvReader {
public:
	struct Options {
		char delimiter = ',';
		bool skip_blank_lines = true;
	};

	CsvReader();
	explicit CsvReader(Options options);

	/**
	 * @throws std::runtime_error If the file cannot be read.
	 * @throws core::SchemaError With kind MalformedInput for undecodable content.
	 */
	core::RawTable readFile(const std::string &path) const;

	/// @throws core::SchemaError With kind MalformedInput for undecodable content.
	core::RawTable parse(const std::string &content) const;

private:
	std::vector<std::vector<std::string>> splitRecords(const std::string &content) const;
	static core::RawTable::Cell toCell(const std::string &field);

	Options options_;
};

} // namespace tsforecast::io
