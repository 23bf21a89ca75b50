#pragma once

#include "thermocast/core/reading.hpp"
#include "thermocast/core/series_sanitizer.hpp"
#include "thermocast/core/temperature_range.hpp"
#include "thermocast/engine/forecast_dispatcher.hpp"
#include "thermocast/engine/history_annotator.hpp"
#include "thermocast/engine/prediction_options.hpp"
#include "thermocast/models/double_exponential.hpp"
#include "thermocast/models/model_factory.hpp"
#include "thermocast/models/moving_average_trend.hpp"
#include "thermocast/utils/random_source.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace thermocast::quick {

namespace internal {
inline engine::PredictionOptions options(models::Method method, double horizon_minutes) {
	return engine::PredictionOptionsBuilder().withMethod(method).withHorizonMinutes(horizon_minutes).build();
}
} // namespace internal

inline std::vector<double> sanitize(const std::vector<double> &raw_temperatures) {
	return core::sanitize(raw_temperatures);
}

inline std::vector<double> sanitize(const std::vector<std::optional<double>> &raw_temperatures) {
	return core::sanitize(raw_temperatures);
}

/// Double exponential smoothing forecast @p horizon_steps ahead, full precision.
inline double forecastExponential(const std::vector<double> &series, int horizon_steps) {
	models::DoubleExponentialSmoothing model;
	return model.forecast(series, horizon_steps);
}

/// Moving average plus trend forecast @p horizon_steps ahead, full precision.
inline double forecastMovingAverage(const std::vector<double> &series, int horizon_steps) {
	models::MovingAverageTrend model;
	return model.forecast(series, horizon_steps);
}

inline double forecastOne(const std::vector<core::Reading> &history, const core::Reading &current,
                          models::Method method = models::Method::Exponential, double horizon_minutes = 7.5,
                          std::shared_ptr<utils::RandomSource> random = utils::defaultRandomSource()) {
	const engine::ForecastDispatcher dispatcher(internal::options(method, horizon_minutes), std::move(random));
	return dispatcher.forecastOne(history, current);
}

inline double forecastOne(const std::vector<core::Reading> &history, const core::Reading &current,
                          const std::string &method, double horizon_minutes = 7.5,
                          std::shared_ptr<utils::RandomSource> random = utils::defaultRandomSource()) {
	return forecastOne(history, current, models::parseMethod(method), horizon_minutes, std::move(random));
}

inline std::vector<core::AnnotatedReading>
annotateHistory(const std::vector<core::AnnotatedReading> &points,
                models::Method method = models::Method::Exponential, double horizon_minutes = 7.5,
                std::shared_ptr<utils::RandomSource> random = utils::defaultRandomSource()) {
	const engine::HistoryAnnotator annotator(internal::options(method, horizon_minutes), std::move(random));
	return annotator.annotate(points);
}

inline std::vector<core::AnnotatedReading>
annotateHistory(const std::vector<core::AnnotatedReading> &points, const std::string &method,
                double horizon_minutes = 7.5,
                std::shared_ptr<utils::RandomSource> random = utils::defaultRandomSource()) {
	return annotateHistory(points, models::parseMethod(method), horizon_minutes, std::move(random));
}

inline core::AnnotatedReading
annotateLatest(const std::vector<core::Reading> &history, const core::Reading &latest, models::Method method,
               double horizon_minutes, core::Reading::TimePoint now,
               std::shared_ptr<utils::RandomSource> random = utils::defaultRandomSource()) {
	const engine::HistoryAnnotator annotator(internal::options(method, horizon_minutes), std::move(random));
	return annotator.annotateLatest(history, latest, now);
}

} // namespace thermocast::quick
