#pragma once

#include "thermocast/core/temperature_range.hpp"

#include <chrono>
#include <optional>
#include <utility>

namespace thermocast::core {

/**
 * @struct Reading
 * @brief A single sensor sample as delivered by the ingestion pipeline.
 *
 * Only the temperature is read by the forecasting engine. Humidity and motion
 * are carried along untouched so that annotated output can be handed straight
 * to the presentation layer.
 */
struct Reading {
	using TimePoint = std::chrono::system_clock::time_point;

	std::optional<double> temperature;
	TimePoint timestamp{};
	std::optional<double> humidity;
	std::optional<bool> motion;

	/// True when the temperature is present, finite and strictly positive.
	bool hasUsableTemperature() const {
		return temperature.has_value() && isUsableTemperature(*temperature);
	}
};

/**
 * @struct AnnotatedReading
 * @brief A reading together with the forecast made for it.
 *
 * A present @c predicted_temperature is owned by whoever set it; the engine
 * only fills missing values and never recomputes existing ones.
 */
struct AnnotatedReading {
	Reading reading;
	std::optional<double> predicted_temperature;
	std::optional<Reading::TimePoint> predicted_at;

	AnnotatedReading() = default;
	explicit AnnotatedReading(Reading r, std::optional<double> predicted = std::nullopt)
	    : reading(std::move(r)), predicted_temperature(predicted) {
	}
};

} // namespace thermocast::core
