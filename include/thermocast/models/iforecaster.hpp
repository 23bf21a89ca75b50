#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace thermocast::models {

/**
 * @class ITemperatureForecaster
 * @brief Interface shared by the temperature forecasting models.
 *
 * A model is fitted on a sanitized series (oldest first) and then asked for a
 * single point forecast a number of sampling steps ahead. Models never throw
 * on short series: with too little data they fall back to the last observed
 * value, or to the fallback temperature when the series is empty.
 */
class ITemperatureForecaster {
public:
	virtual ~ITemperatureForecaster() = default;

	/**
	 * @brief Fits the model to a sanitized temperature series.
	 * @param series Valid temperatures, oldest first. May be empty.
	 */
	virtual void fit(const std::vector<double> &series) = 0;

	/**
	 * @brief Forecasts the temperature @p horizon_steps sampling steps ahead.
	 * @throws std::runtime_error If called before fit().
	 * @throws std::invalid_argument If @p horizon_steps is negative.
	 */
	virtual double predict(int horizon_steps) = 0;

	/**
	 * @brief Number of trailing points the model looks at.
	 */
	virtual std::size_t window() const = 0;

	/**
	 * @brief Gets the name of the model (e.g., "DoubleExponentialSmoothing").
	 */
	virtual std::string getName() const = 0;

	/// Fits on @p series and returns predict(@p horizon_steps).
	double forecast(const std::vector<double> &series, int horizon_steps) {
		fit(series);
		return predict(horizon_steps);
	}
};

} // namespace thermocast::models
