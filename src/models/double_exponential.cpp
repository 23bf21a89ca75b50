#include "thermocast/models/double_exponential.hpp"
#include "thermocast/core/temperature_range.hpp"
#include "thermocast/utils/logging.hpp"
#include <stdexcept>

namespace thermocast::models {

void DoubleExponentialSmoothing::fit(const std::vector<double> &series) {
	is_fitted_ = true;
	if (series.size() < kMinimumPoints) {
		uses_fallback_ = true;
		fallback_value_ = series.empty() ? core::kFallbackTemperature : series.back();
		level_ = fallback_value_;
		trend_ = 0.0;
		THERMOCAST_TRACE("Double exponential smoothing has {} point(s); using last value {}.", series.size(),
		                 fallback_value_);
		return;
	}
	uses_fallback_ = false;

	// Only the trailing window takes part in the recursion.
	const std::size_t start = series.size() > kWindow ? series.size() - kWindow : 0;
	const std::size_t count = series.size() - start;

	double current_level = series[start];
	double current_trend = count > 1 ? series[start + 1] - series[start] : 0.0;

	for (std::size_t i = start + 1; i < series.size(); ++i) {
		const double last_level = current_level;
		current_level = kAlpha * series[i] + (1.0 - kAlpha) * (last_level + current_trend);
		current_trend = kBeta * (current_level - last_level) + (1.0 - kBeta) * current_trend;
	}

	level_ = current_level;
	trend_ = current_trend;
	THERMOCAST_TRACE("Double exponential smoothing fitted on {} points. Level = {}, trend = {}.", count, level_,
	                 trend_);
}

double DoubleExponentialSmoothing::predict(int horizon_steps) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon_steps < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (uses_fallback_) {
		return fallback_value_;
	}
	return core::clampTemperature(level_ + trend_ * static_cast<double>(horizon_steps));
}

} // namespace thermocast::models
