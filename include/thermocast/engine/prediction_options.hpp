#pragma once

#include "thermocast/models/model_factory.hpp"
#include <string>

namespace thermocast::engine {

/**
 * @struct PredictionOptions
 * @brief Per-request settings for the dispatcher and the annotator.
 *
 * Only the model and the horizon are selectable; smoothing constants and
 * windows are fixed by the models themselves.
 */
struct PredictionOptions {
	models::Method method = models::Method::Exponential;
	/// How far ahead to forecast, in minutes. The dashboard offers 5, 7.5, 10 and 15.
	double horizon_minutes = 7.5;

	/**
	 * @brief Checks that the horizon is finite, non-negative and fits an int step count.
	 * @throws std::invalid_argument Otherwise.
	 */
	void validate() const;

	/// Horizon converted to 5-second sampling steps, round(minutes * 12).
	int horizonSteps() const;
};

/**
 * @class PredictionOptionsBuilder
 * @brief Fluent construction of validated PredictionOptions.
 */
class PredictionOptionsBuilder {
public:
	PredictionOptionsBuilder &withMethod(models::Method method);

	/// Sets the method from its dashboard name; see models::parseMethod().
	PredictionOptionsBuilder &withMethodName(const std::string &name);

	PredictionOptionsBuilder &withHorizonMinutes(double minutes);

	/**
	 * @brief Returns the configured options.
	 * @throws std::invalid_argument If the horizon is invalid.
	 */
	PredictionOptions build() const;

private:
	PredictionOptions options_;
};

} // namespace thermocast::engine
