#pragma once

#include "thermocast/models/iforecaster.hpp"

namespace thermocast::models {

/**
 * @class DoubleExponentialSmoothing
 * @brief Holt's linear trend smoother over the most recent readings.
 *
 * Tracks a level and a trend over the trailing window and extrapolates the
 * trend linearly. Smoothing constants and window size are fixed. The forecast
 * is clamped to the plausible operating range.
 *
 * With fewer than kMinimumPoints values the model does not smooth at all and
 * returns the last value verbatim (or the fallback temperature when empty).
 */
class DoubleExponentialSmoothing final : public ITemperatureForecaster {
public:
	static constexpr double kAlpha = 0.3;
	static constexpr double kBeta = 0.2;
	static constexpr std::size_t kWindow = 20;
	static constexpr std::size_t kMinimumPoints = 3;

	void fit(const std::vector<double> &series) override;
	double predict(int horizon_steps) override;
	std::size_t window() const override {
		return kWindow;
	}
	std::string getName() const override {
		return "DoubleExponentialSmoothing";
	}

	/// Final smoothed level. Meaningless while usesFallback() is true.
	double level() const {
		return level_;
	}

	/// Final smoothed per-step trend. Meaningless while usesFallback() is true.
	double trend() const {
		return trend_;
	}

	/// True when the last fit had too few points to smooth.
	bool usesFallback() const {
		return uses_fallback_;
	}

private:
	double level_ = 0.0;
	double trend_ = 0.0;
	double fallback_value_ = 0.0;
	bool uses_fallback_ = false;
	bool is_fitted_ = false;
};

} // namespace thermocast::models
