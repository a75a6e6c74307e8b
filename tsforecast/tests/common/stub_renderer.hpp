#pragma once

#include "tsforecast/chart/chart_renderer.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace tests::helpers {

// Returns a fixed four-byte "image" and counts its calls.
class StubRenderer final : public tsforecast::chart::IChartRenderer {
public:
	std::vector<std::uint8_t> render(const tsforecast::chart::ChartPayload &) const override {
		++calls_;
		return {0x89, 'P', 'N', 'G'};
	}

	int calls() const {
		return calls_.load();
	}

private:
	mutable std::atomic<int> calls_{0};
};

} // namespace tests::helpers
