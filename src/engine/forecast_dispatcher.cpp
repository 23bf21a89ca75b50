#include "thermocast/engine/forecast_dispatcher.hpp"
#include "thermocast/core/series_sanitizer.hpp"
#include "thermocast/core/temperature_range.hpp"
#include "thermocast/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace thermocast::engine {

double enforceVisibleDifference(double forecast, double current, double last_delta, utils::RandomSource &random) {
	if (std::abs(forecast - current) >= core::kMinimumVisibleDifference) {
		return forecast;
	}

	double offset;
	if (last_delta > 0.0) {
		offset = core::kMinimumVisibleDifference;
	} else if (last_delta < 0.0) {
		offset = -core::kMinimumVisibleDifference;
	} else {
		offset = random.uniform() > 0.5 ? core::kMinimumVisibleDifference : -core::kMinimumVisibleDifference;
	}

	const double nudged = core::clampTemperature(current + offset);
	THERMOCAST_TRACE("Forecast {} within {} of current {}; nudged to {}.", forecast,
	                 core::kMinimumVisibleDifference, current, nudged);
	return nudged;
}

ForecastDispatcher::ForecastDispatcher(PredictionOptions options, std::shared_ptr<utils::RandomSource> random)
    : options_(std::move(options)), horizon_steps_(options_.horizonSteps()),
      window_(models::createForecaster(options_.method)->window()), random_(std::move(random)) {
	if (!random_) {
		throw std::invalid_argument("ForecastDispatcher requires a random source.");
	}
}

double ForecastDispatcher::forecastOne(const std::vector<core::Reading> &history,
                                       const core::Reading &current) const {
	return forecastSanitized(core::sanitize(history), current.temperature);
}

double ForecastDispatcher::forecastSanitized(const std::vector<double> &sanitized_history,
                                             const std::optional<double> &current_temperature) const {
	if (!current_temperature || !core::isUsableTemperature(*current_temperature)) {
		return core::kFallbackTemperature;
	}
	const double current = *current_temperature;
	if (sanitized_history.empty()) {
		return current;
	}

	// The models never look past their window, so the rest of the history is not copied.
	const std::size_t keep = std::min(sanitized_history.size(), window_ > 0 ? window_ - 1 : 0);
	std::vector<double> working(sanitized_history.end() - static_cast<std::ptrdiff_t>(keep),
	                            sanitized_history.end());
	working.push_back(current);

	auto model = models::createForecaster(options_.method);
	const double forecast = model->forecast(working, horizon_steps_);
	const double last_delta = current - sanitized_history.back();

	return core::roundToHundredths(enforceVisibleDifference(forecast, current, last_delta, *random_));
}

} // namespace thermocast::engine
