#include "thermocast/models/model_factory.hpp"
#include "thermocast/models/double_exponential.hpp"
#include "thermocast/models/moving_average_trend.hpp"
#include "thermocast/utils/logging.hpp"
#include <stdexcept>

namespace thermocast::models {

Method parseMethod(const std::string &name) {
	if (name == "exponential") {
		return Method::Exponential;
	}
	if (name == "moving_average" || name == "moving_avg") {
		return Method::MovingAverage;
	}
	throw std::invalid_argument("Unknown forecasting method '" + name +
	                            "'. Expected 'exponential' or 'moving_average'.");
}

std::string methodName(Method method) {
	switch (method) {
	case Method::Exponential:
		return "exponential";
	case Method::MovingAverage:
		return "moving_average";
	}
	throw std::invalid_argument("Unknown forecasting method.");
}

std::unique_ptr<ITemperatureForecaster> createForecaster(Method method) {
	switch (method) {
	case Method::Exponential:
		return std::make_unique<DoubleExponentialSmoothing>();
	case Method::MovingAverage:
		return std::make_unique<MovingAverageTrend>();
	}
	THERMOCAST_ERROR("createForecaster received an out-of-range method value {}.", static_cast<int>(method));
	throw std::invalid_argument("Unknown forecasting method.");
}

} // namespace thermocast::models
