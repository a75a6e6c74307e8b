#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace tsforecast::core {

/**
 * @brief Base class of every recoverable pipeline failure.
 *
 * The service facades convert any ForecastError into an error response; none
 * of these are fatal for the hosting process.
 */
class ForecastError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @brief Raised when tabular input cannot be interpreted as a time series.
 */
class SchemaError : public ForecastError {
public:
	enum class Kind {
		TooFewColumns,
		UnparsableTimestamp,
		UnparsableNumeric,
		MalformedInput
	};

	SchemaError(Kind kind, std::string column, const std::string &message)
	    : ForecastError(message), kind_(kind), column_(std::move(column)) {
	}

	Kind kind() const {
		return kind_;
	}

	/// Name of the offending column, empty when the failure is table-wide.
	const std::string &column() const {
		return column_;
	}

private:
	Kind kind_;
	std::string column_;
};

/**
 * @brief Raised when too few rows remain to build or model a series.
 */
class InsufficientDataError : public ForecastError {
public:
	InsufficientDataError(std::size_t observed, std::size_t required, const std::string &message)
	    : ForecastError(message), observed_(observed), required_(required) {
	}

	std::size_t observed() const {
		return observed_;
	}

	std::size_t required() const {
		return required_;
	}

private:
	std::size_t observed_;
	std::size_t required_;
};

/**
 * @brief Raised when model estimation fails or the model does not suit the series.
 */
class FitError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/**
 * @brief Raised when a forecast is requested from a facade that holds no model.
 */
class NotLoadedError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

} // namespace tsforecast::core
