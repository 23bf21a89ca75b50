#pragma once

#include "thermocast/core/reading.hpp"
#include "thermocast/engine/prediction_options.hpp"
#include "thermocast/utils/random_source.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace thermocast::engine {

/**
 * @brief Minimum-visible-difference policy.
 *
 * When @p forecast is strictly closer than 0.2 to @p current, it is replaced by
 * current + 0.2 or current - 0.2 depending on the sign of @p last_delta (a draw
 * from @p random decides when the delta is zero) and clamped to the operating
 * range. Forecasts at least 0.2 away are returned unchanged.
 */
double enforceVisibleDifference(double forecast, double current, double last_delta, utils::RandomSource &random);

/**
 * @class ForecastDispatcher
 * @brief Produces the delivered forecast for a single current reading.
 *
 * Selects the model from the options, converts the horizon to sampling steps,
 * forecasts from the sanitized history plus the current temperature, applies
 * the minimum-visible-difference nudge and rounds to 2 decimal places.
 *
 * The dispatcher keeps no state between calls. The random source is only
 * consulted when the last observed delta is exactly zero and a nudge is due.
 */
class ForecastDispatcher {
public:
	/**
	 * @param options Validated on construction.
	 * @param random Tie-break source for the nudge direction.
	 * @throws std::invalid_argument If @p options are invalid or @p random is null.
	 */
	explicit ForecastDispatcher(PredictionOptions options,
	                            std::shared_ptr<utils::RandomSource> random = utils::defaultRandomSource());

	/**
	 * @brief Forecast as of @p current, using @p history (oldest first) as the past.
	 *
	 * Returns the fallback temperature when @p current has no usable temperature,
	 * and the current temperature unchanged when the history has none.
	 */
	double forecastOne(const std::vector<core::Reading> &history, const core::Reading &current) const;

	/**
	 * @brief Same as forecastOne() for an already sanitized history.
	 *
	 * Only the trailing model window of @p sanitized_history is read.
	 */
	double forecastSanitized(const std::vector<double> &sanitized_history,
	                         const std::optional<double> &current_temperature) const;

	const PredictionOptions &options() const {
		return options_;
	}

	int horizonSteps() const {
		return horizon_steps_;
	}

private:
	PredictionOptions options_;
	int horizon_steps_;
	std::size_t window_;
	std::shared_ptr<utils::RandomSource> random_;
};

} // namespace thermocast::engine
