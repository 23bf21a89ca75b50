#include "thermocast/quick.hpp"
#include "thermocast/utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace thermocast;

namespace {

// Simulated 5-second sensor feed: a slowly drifting ambient baseline with
// short-term noise on top, like the dashboard's demo data source.
std::vector<core::Reading> simulateFeed(std::size_t count, unsigned seed) {
	std::mt19937 rng(seed);
	std::uniform_real_distribution<double> drift(-0.02, 0.02);
	std::uniform_real_distribution<double> noise(-0.3, 0.3);
	std::uniform_real_distribution<double> humidity_step(-0.8, 0.8);
	std::bernoulli_distribution motion(0.08);

	std::vector<core::Reading> feed;
	feed.reserve(count);

	const auto start = std::chrono::system_clock::now() - std::chrono::seconds(5 * count);
	double baseline = 22.0;
	double humidity = 45.0;
	for (std::size_t i = 0; i < count; ++i) {
		baseline = std::max(18.0, std::min(28.0, baseline + drift(rng)));
		humidity = std::max(30.0, std::min(70.0, humidity + humidity_step(rng)));

		core::Reading reading;
		reading.temperature = core::roundToHundredths(core::clampTemperature(baseline + noise(rng)));
		reading.humidity = core::roundToHundredths(humidity);
		reading.motion = motion(rng);
		reading.timestamp = start + std::chrono::seconds(core::kSamplingPeriodSeconds * static_cast<long>(i));

		// Every so often the sensor drops a sample.
		if (i % 37 == 36) {
			reading.temperature.reset();
		}
		feed.push_back(reading);
	}
	return feed;
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printTail(const std::string &label, const std::vector<core::AnnotatedReading> &annotated, std::size_t show_n) {
	std::cout << "  " << std::setw(28) << std::left << label << ": ";
	const std::size_t first = annotated.size() > show_n ? annotated.size() - show_n : 0;
	for (std::size_t i = first; i < annotated.size(); ++i) {
		std::cout << std::fixed << std::setprecision(2) << *annotated[i].predicted_temperature;
		if (i + 1 < annotated.size()) {
			std::cout << ", ";
		}
	}
	std::cout << "\n";
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	const auto feed = simulateFeed(240, 17);
	std::vector<core::AnnotatedReading> points;
	points.reserve(feed.size());
	for (const auto &reading : feed) {
		points.emplace_back(reading);
	}

	THERMOCAST_INFO("Simulated {} readings ({} usable temperatures).", feed.size(), core::sanitize(feed).size());

	printHeader("Observed (last 8)");
	std::cout << "  " << std::setw(28) << std::left << "temperature" << ": ";
	for (std::size_t i = feed.size() - 8; i < feed.size(); ++i) {
		if (feed[i].temperature) {
			std::cout << std::fixed << std::setprecision(2) << *feed[i].temperature;
		} else {
			std::cout << "--";
		}
		if (i + 1 < feed.size()) {
			std::cout << ", ";
		}
	}
	std::cout << "\n";
	std::cout.unsetf(std::ios::floatfield);

	// Seeded so the tie-break direction is reproducible between runs.
	auto random = std::make_shared<utils::SeededRandomSource>(2024);

	for (double horizon : {5.0, 7.5, 10.0, 15.0}) {
		std::ostringstream title;
		title << "Forecasts " << horizon << " minutes ahead (last 8)";
		printHeader(title.str());
		for (auto method : {models::Method::Exponential, models::Method::MovingAverage}) {
			const auto annotated = quick::annotateHistory(points, method, horizon, random);
			printTail(models::methodName(method), annotated, 8);
		}
	}

	printHeader("Latest reading");
	const std::vector<core::Reading> history(feed.begin(), feed.end() - 1);
	const auto latest = quick::annotateLatest(history, feed.back(), models::Method::Exponential, 7.5,
	                                          std::chrono::system_clock::now(), random);
	std::cout << "  current:   ";
	if (latest.reading.temperature) {
		std::cout << std::fixed << std::setprecision(2) << *latest.reading.temperature << "\n";
	} else {
		std::cout << "--\n";
	}
	std::cout << "  predicted: " << std::fixed << std::setprecision(2) << *latest.predicted_temperature << "\n";

	return 0;
}
