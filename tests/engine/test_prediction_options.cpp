#include <catch2/catch.hpp>

#include "thermocast/engine/prediction_options.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using thermocast::engine::PredictionOptions;
using thermocast::engine::PredictionOptionsBuilder;
using thermocast::models::Method;

TEST_CASE("Prediction options default to exponential at 7.5 minutes", "[engine][options]") {
	const PredictionOptions options;
	REQUIRE(options.method == Method::Exponential);
	REQUIRE(options.horizon_minutes == 7.5);
	REQUIRE(options.horizonSteps() == 90);
}

TEST_CASE("Horizon minutes convert to 5-second steps", "[engine][options]") {
	PredictionOptions options;

	options.horizon_minutes = 5.0;
	REQUIRE(options.horizonSteps() == 60);
	options.horizon_minutes = 10.0;
	REQUIRE(options.horizonSteps() == 120);
	options.horizon_minutes = 15.0;
	REQUIRE(options.horizonSteps() == 180);
	options.horizon_minutes = 0.0;
	REQUIRE(options.horizonSteps() == 0);

	// Fractional step counts round to the nearest step, halves away from zero.
	options.horizon_minutes = 0.04;
	REQUIRE(options.horizonSteps() == 0);
	options.horizon_minutes = 0.125;
	REQUIRE(options.horizonSteps() == 2);
}

TEST_CASE("Invalid horizons are rejected", "[engine][options][validation]") {
	PredictionOptions options;

	options.horizon_minutes = -0.5;
	REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);

	options.horizon_minutes = std::nan("");
	REQUIRE_THROWS_AS(options.horizonSteps(), std::invalid_argument);

	options.horizon_minutes = std::numeric_limits<double>::infinity();
	REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);

	options.horizon_minutes = 1e12;
	REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
}

TEST_CASE("Options builder configures and validates", "[engine][options][builder]") {
	const auto options = PredictionOptionsBuilder().withMethodName("moving_avg").withHorizonMinutes(10.0).build();
	REQUIRE(options.method == Method::MovingAverage);
	REQUIRE(options.horizonSteps() == 120);

	REQUIRE(PredictionOptionsBuilder().withMethod(Method::Exponential).build().method == Method::Exponential);

	REQUIRE_THROWS_AS(PredictionOptionsBuilder().withHorizonMinutes(-1.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(PredictionOptionsBuilder().withMethodName("holt"), std::invalid_argument);
}
