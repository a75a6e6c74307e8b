#pragma once

#include "tsforecast/core/frequency.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tsforecast::core {

/**
 * @class TimeSeries
 * @brief A univariate sequence of observations over time.
 *
 * Timestamps and values are kept in separate vectors for cache-efficient
 * numerical processing. Timestamps must be strictly increasing. A series that
 * went through the regularizer additionally carries its calendar frequency and
 * the name of the column its values came from.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;
	using Metadata = std::unordered_map<std::string, std::string>;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of time points.
	 * @param values A vector of corresponding values.
	 * @param label Name of the value column, may be empty.
	 * @throws std::invalid_argument If the sizes differ or timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::string label = {},
	           std::optional<Frequency> frequency = std::nullopt)
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), label_(std::move(label)),
	      frequency_(frequency) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	const std::string &label() const {
		return label_;
	}

	std::optional<Frequency> frequency() const {
		return frequency_;
	}

	void setFrequency(Frequency frequency) {
		frequency_ = frequency;
	}

	const Metadata &metadata() const {
		return metadata_;
	}

	void setMetadata(Metadata metadata) {
		metadata_ = std::move(metadata);
	}

	/**
	 * @brief Gets the number of data points in the series.
	 */
	std::size_t size() const {
		return timestamps_.size();
	}

	bool isEmpty() const {
		return size() == 0;
	}

	const TimePoint &firstTimestamp() const {
		if (isEmpty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return timestamps_.front();
	}

	const TimePoint &lastTimestamp() const {
		if (isEmpty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return timestamps_.back();
	}

	/**
	 * @brief Copies the half-open index range [start, end) into a new series.
	 */
	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}
		std::vector<TimePoint> sliced_timestamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
		                                         timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> sliced_values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                                 values_.begin() + static_cast<std::ptrdiff_t>(end));
		TimeSeries result(std::move(sliced_timestamps), std::move(sliced_values), label_, frequency_);
		result.setMetadata(metadata_);
		return result;
	}

	bool hasMissingValues() const {
		for (double v : values_) {
			if (!std::isfinite(v)) {
				return true;
			}
		}
		return false;
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	std::string label_;
	std::optional<Frequency> frequency_;
	Metadata metadata_;
};

} // namespace tsforecast::core
