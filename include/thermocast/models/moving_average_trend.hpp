#pragma once

#include "thermocast/models/iforecaster.hpp"

namespace thermocast::models {

/**
 * @class MovingAverageTrend
 * @brief Trailing mean plus a short linear trend.
 *
 * The mean covers the last kWindow values; the trend is the average per-step
 * change across the last kTrendWindow values. Lighter than
 * DoubleExponentialSmoothing and used as its comparison baseline.
 */
class MovingAverageTrend final : public ITemperatureForecaster {
public:
	static constexpr std::size_t kWindow = 15;
	static constexpr std::size_t kTrendWindow = 5;
	static constexpr std::size_t kMinimumPoints = 2;

	void fit(const std::vector<double> &series) override;
	double predict(int horizon_steps) override;
	std::size_t window() const override {
		return kWindow;
	}
	std::string getName() const override {
		return "MovingAverageTrend";
	}

	double mean() const {
		return mean_;
	}

	double trend() const {
		return trend_;
	}

	bool usesFallback() const {
		return uses_fallback_;
	}

private:
	double mean_ = 0.0;
	double trend_ = 0.0;
	double fallback_value_ = 0.0;
	bool uses_fallback_ = false;
	bool is_fitted_ = false;
};

} // namespace thermocast::models
