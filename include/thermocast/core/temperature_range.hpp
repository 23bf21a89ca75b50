#pragma once

#include <algorithm>
#include <cmath>

namespace thermocast::core {

/// Lowest forecast the engine will deliver (degrees Celsius).
constexpr double kMinTemperature = 15.0;

/// Highest forecast the engine will deliver (degrees Celsius).
constexpr double kMaxTemperature = 35.0;

/// Answer used when there is no usable temperature at all.
constexpr double kFallbackTemperature = 22.0;

/// Smallest gap between forecast and current reading that stays visible on a chart.
constexpr double kMinimumVisibleDifference = 0.2;

/// Readings arrive every 5 seconds, i.e. 12 steps per minute.
constexpr int kSamplingPeriodSeconds = 5;
constexpr int kStepsPerMinute = 60 / kSamplingPeriodSeconds;

inline double clampTemperature(double value) {
	return std::max(kMinTemperature, std::min(kMaxTemperature, value));
}

/// Rounds to 2 decimal places, half away from zero.
inline double roundToHundredths(double value) {
	return std::round(value * 100.0) / 100.0;
}

/// A temperature is usable when it is finite and strictly positive.
inline bool isUsableTemperature(double value) {
	return std::isfinite(value) && value > 0.0;
}

} // namespace thermocast::core
