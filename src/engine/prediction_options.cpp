#include "thermocast/engine/prediction_options.hpp"
#include "thermocast/core/temperature_range.hpp"
#include "thermocast/utils/logging.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace thermocast::engine {

void PredictionOptions::validate() const {
	if (!std::isfinite(horizon_minutes)) {
		throw std::invalid_argument("Forecast horizon must be a finite number of minutes.");
	}
	if (horizon_minutes < 0.0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	const double steps = std::round(horizon_minutes * core::kStepsPerMinute);
	if (steps > static_cast<double>(std::numeric_limits<int>::max())) {
		throw std::invalid_argument("Forecast horizon is too large.");
	}
}

int PredictionOptions::horizonSteps() const {
	validate();
	return static_cast<int>(std::lround(horizon_minutes * core::kStepsPerMinute));
}

PredictionOptionsBuilder &PredictionOptionsBuilder::withMethod(models::Method method) {
	options_.method = method;
	return *this;
}

PredictionOptionsBuilder &PredictionOptionsBuilder::withMethodName(const std::string &name) {
	options_.method = models::parseMethod(name);
	return *this;
}

PredictionOptionsBuilder &PredictionOptionsBuilder::withHorizonMinutes(double minutes) {
	options_.horizon_minutes = minutes;
	return *this;
}

PredictionOptions PredictionOptionsBuilder::build() const {
	options_.validate();
	THERMOCAST_DEBUG("Prediction options: method = {}, horizon = {} min ({} steps).",
	                 models::methodName(options_.method), options_.horizon_minutes, options_.horizonSteps());
	return options_;
}

} // namespace thermocast::engine
