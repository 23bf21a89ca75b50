#include "thermocast/models/moving_average_trend.hpp"
#include "thermocast/core/temperature_range.hpp"
#include "thermocast/utils/logging.hpp"
#include <algorithm>
#include <cstddef>
#include <numeric>
#include <stdexcept>

namespace thermocast::models {

void MovingAverageTrend::fit(const std::vector<double> &series) {
	is_fitted_ = true;
	if (series.size() < kMinimumPoints) {
		uses_fallback_ = true;
		fallback_value_ = series.empty() ? core::kFallbackTemperature : series.back();
		mean_ = fallback_value_;
		trend_ = 0.0;
		THERMOCAST_TRACE("Moving average has {} point(s); using last value {}.", series.size(), fallback_value_);
		return;
	}
	uses_fallback_ = false;

	const std::size_t count = std::min(kWindow, series.size());
	const double sum = std::accumulate(series.end() - static_cast<std::ptrdiff_t>(count), series.end(), 0.0);
	mean_ = sum / static_cast<double>(count);

	const std::size_t recent = std::min(kTrendWindow, series.size());
	if (recent >= 2) {
		const double first = series[series.size() - recent];
		trend_ = (series.back() - first) / static_cast<double>(recent - 1);
	} else {
		trend_ = 0.0;
	}

	THERMOCAST_TRACE("Moving average fitted on {} points. Mean = {}, trend = {}.", count, mean_, trend_);
}

double MovingAverageTrend::predict(int horizon_steps) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon_steps < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (uses_fallback_) {
		return fallback_value_;
	}
	return core::clampTemperature(mean_ + trend_ * static_cast<double>(horizon_steps));
}

} // namespace thermocast::models
