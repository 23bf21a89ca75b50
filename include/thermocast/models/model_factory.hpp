#pragma once

#include "thermocast/models/iforecaster.hpp"
#include <memory>
#include <string>

namespace thermocast::models {

/// The forecasting models a caller can select.
enum class Method {
	Exponential,
	MovingAverage
};

/**
 * @brief Parses a method name as sent by the dashboard.
 *
 * Accepts "exponential", "moving_average" and the short form "moving_avg".
 * @throws std::invalid_argument For any other name.
 */
Method parseMethod(const std::string &name);

/// Canonical name of a method ("exponential" or "moving_average").
std::string methodName(Method method);

/// Creates a fresh, unfitted model for @p method.
std::unique_ptr<ITemperatureForecaster> createForecaster(Method method);

} // namespace thermocast::models
