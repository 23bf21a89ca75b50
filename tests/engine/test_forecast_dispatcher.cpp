#include <catch2/catch.hpp>

#include "thermocast/core/series_sanitizer.hpp"
#include "thermocast/engine/forecast_dispatcher.hpp"
#include "common/reading_helpers.hpp"

#include <cmath>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

using thermocast::engine::enforceVisibleDifference;
using thermocast::engine::ForecastDispatcher;
using thermocast::engine::PredictionOptions;
using thermocast::models::Method;
using thermocast::utils::FixedRandomSource;
using tests::helpers::makeReading;
using tests::helpers::makeReadings;

namespace {

class CountingRandomSource final : public thermocast::utils::RandomSource {
public:
	double uniform() override {
		++calls;
		return 0.9;
	}
	int calls = 0;
};

PredictionOptions optionsFor(Method method, double horizon_minutes) {
	PredictionOptions options;
	options.method = method;
	options.horizon_minutes = horizon_minutes;
	return options;
}

ForecastDispatcher dispatcherWith(Method method, double horizon_minutes, double draw = 0.9) {
	return ForecastDispatcher(optionsFor(method, horizon_minutes), std::make_shared<FixedRandomSource>(draw));
}

} // namespace

TEST_CASE("Dispatcher falls back to 22.0 without a usable current temperature", "[engine][dispatcher]") {
	const auto dispatcher = dispatcherWith(Method::Exponential, 7.5);
	const auto history = makeReadings({20.0, 21.0, 22.0});

	REQUIRE(dispatcher.forecastOne({}, makeReading(std::nullopt)) == 22.0);
	REQUIRE(dispatcher.forecastOne(history, makeReading(std::nullopt)) == 22.0);
	REQUIRE(dispatcher.forecastOne(history, makeReading(std::nan(""))) == 22.0);
	REQUIRE(dispatcher.forecastOne(history, makeReading(-1.0)) == 22.0);
	REQUIRE(dispatcher.forecastOne(history, makeReading(0.0)) == 22.0);
}

TEST_CASE("Dispatcher returns the current temperature when history has none", "[engine][dispatcher]") {
	const auto dispatcher = dispatcherWith(Method::Exponential, 7.5);
	REQUIRE(dispatcher.forecastOne({}, makeReading(40.0)) == 40.0);
	REQUIRE(dispatcher.forecastOne(makeReadings({std::nullopt, -2.0}), makeReading(21.234)) == 21.234);
}

TEST_CASE("Dispatcher forecasts from history plus the current reading", "[engine][dispatcher]") {
	const auto dispatcher = dispatcherWith(Method::Exponential, 1.0);
	REQUIRE(dispatcher.horizonSteps() == 12);

	const double forecast = dispatcher.forecastOne(makeReadings({20.0, 20.5}), makeReading(21.0));
	REQUIRE(forecast == Catch::Detail::Approx(27.0));
}

TEST_CASE("Dispatcher skips unusable history values", "[engine][dispatcher]") {
	const auto dispatcher = dispatcherWith(Method::Exponential, 1.0);
	const auto clean = dispatcher.forecastOne(makeReadings({20.0, 20.5}), makeReading(21.0));
	const auto noisy =
	    dispatcher.forecastOne(makeReadings({std::nullopt, 20.0, 0.0, std::nan(""), 20.5, -4.0}), makeReading(21.0));
	REQUIRE(clean == noisy);
}

TEST_CASE("Flat series are nudged in the drawn direction", "[engine][dispatcher][nudge]") {
	const auto history = makeReadings({21.0, 21.0, 21.0});
	const auto current = makeReading(21.0);

	REQUIRE(dispatcherWith(Method::Exponential, 1.0, 0.9).forecastOne(history, current) == Catch::Detail::Approx(21.2));
	REQUIRE(dispatcherWith(Method::Exponential, 1.0, 0.1).forecastOne(history, current) == Catch::Detail::Approx(20.8));
	// A draw of exactly 0.5 goes down.
	REQUIRE(dispatcherWith(Method::Exponential, 1.0, 0.5).forecastOne(history, current) == Catch::Detail::Approx(20.8));
}

TEST_CASE("Nudge direction follows the last observed delta", "[engine][dispatcher][nudge]") {
	const std::vector<std::optional<double>> flat(14, 21.0);
	const auto history = makeReadings(flat);
	auto source = std::make_shared<CountingRandomSource>();
	const ForecastDispatcher dispatcher(optionsFor(Method::MovingAverage, 0.0), source);

	// Mean of fifteen points barely moves, so both forecasts land within 0.2 of the current value.
	REQUIRE(dispatcher.forecastOne(history, makeReading(21.1)) == Catch::Detail::Approx(21.3));
	REQUIRE(dispatcher.forecastOne(history, makeReading(20.9)) == Catch::Detail::Approx(20.7));
	REQUIRE(source->calls == 0);

	REQUIRE(dispatcher.forecastOne(history, makeReading(21.0)) == Catch::Detail::Approx(21.2));
	REQUIRE(source->calls == 1);
}

TEST_CASE("Nudged forecasts are clamped to the operating range", "[engine][dispatcher][nudge]") {
	const auto history = makeReadings({35.0, 35.0});
	REQUIRE(dispatcherWith(Method::Exponential, 7.5, 0.9).forecastOne(history, makeReading(35.0)) == 35.0);
	REQUIRE(dispatcherWith(Method::Exponential, 7.5, 0.1).forecastOne(history, makeReading(35.0)) ==
	        Catch::Detail::Approx(34.8));

	const auto cold = makeReadings({15.0, 15.0});
	REQUIRE(dispatcherWith(Method::MovingAverage, 7.5, 0.1).forecastOne(cold, makeReading(15.0)) == 15.0);
}

TEST_CASE("A gap of exactly the minimum is not nudged", "[engine][dispatcher][nudge]") {
	FixedRandomSource source(0.9);
	const double current = 21.0;

	// Find the largest forecast strictly closer than 0.2 and the next representable value above it.
	double just_inside = current + 0.2;
	while (just_inside - current >= 0.2) {
		just_inside = std::nextafter(just_inside, 0.0);
	}
	const double on_boundary = std::nextafter(just_inside, 100.0);
	REQUIRE(on_boundary - current >= 0.2);

	REQUIRE(enforceVisibleDifference(on_boundary, current, -1.0, source) == on_boundary);
	REQUIRE(enforceVisibleDifference(just_inside, current, -1.0, source) == Catch::Detail::Approx(20.8));
}

TEST_CASE("Forecasts far from the current value are left alone", "[engine][dispatcher][nudge]") {
	FixedRandomSource source(0.9);
	REQUIRE(enforceVisibleDifference(24.0, 21.0, -1.0, source) == 24.0);
	REQUIRE(enforceVisibleDifference(18.5, 21.0, 1.0, source) == 18.5);
}

TEST_CASE("Dispatcher results are bounded, rounded and visibly distinct", "[engine][dispatcher][property]") {
	std::mt19937 rng(2024);
	std::uniform_real_distribution<double> raw(-5.0, 60.0);
	std::uniform_real_distribution<double> plausible(15.2, 34.8);
	std::uniform_int_distribution<int> length(1, 40);

	for (Method method : {Method::Exponential, Method::MovingAverage}) {
		for (double horizon : {0.0, 5.0, 7.5, 15.0}) {
			const auto dispatcher = dispatcherWith(method, horizon, 0.3);
			for (int trial = 0; trial < 50; ++trial) {
				std::vector<std::optional<double>> temps;
				const int n = length(rng);
				for (int i = 0; i < n; ++i) {
					temps.emplace_back(raw(rng));
				}
				temps.emplace_back(plausible(rng));
				const auto history = makeReadings(temps);
				if (thermocast::core::sanitize(history).empty()) {
					continue;
				}

				const double current = std::round(plausible(rng) * 100.0) / 100.0;
				const double forecast = dispatcher.forecastOne(history, makeReading(current));

				REQUIRE(forecast >= 15.0);
				REQUIRE(forecast <= 35.0);
				REQUIRE(std::abs(forecast - current) >= 0.2 - 1e-9);
				REQUIRE(std::abs(forecast * 100.0 - std::round(forecast * 100.0)) < 1e-6);
			}
		}
	}
}

TEST_CASE("Dispatcher rejects invalid configuration", "[engine][dispatcher][validation]") {
	REQUIRE_THROWS_AS(ForecastDispatcher(optionsFor(Method::Exponential, -1.0)), std::invalid_argument);
	REQUIRE_THROWS_AS(ForecastDispatcher(optionsFor(Method::Exponential, std::nan(""))), std::invalid_argument);
	REQUIRE_THROWS_AS(ForecastDispatcher(optionsFor(Method::Exponential, 7.5), nullptr), std::invalid_argument);
}
