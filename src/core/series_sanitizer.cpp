#include "thermocast/core/series_sanitizer.hpp"

namespace thermocast::core {

std::vector<double> sanitize(const std::vector<double> &raw) {
	std::vector<double> valid;
	valid.reserve(raw.size());
	for (double value : raw) {
		if (isUsableTemperature(value)) {
			valid.push_back(value);
		}
	}
	return valid;
}

std::vector<double> sanitize(const std::vector<std::optional<double>> &raw) {
	std::vector<double> valid;
	valid.reserve(raw.size());
	for (const auto &value : raw) {
		if (value && isUsableTemperature(*value)) {
			valid.push_back(*value);
		}
	}
	return valid;
}

std::vector<double> sanitize(const std::vector<Reading> &readings) {
	std::vector<double> valid;
	valid.reserve(readings.size());
	for (const auto &reading : readings) {
		if (reading.hasUsableTemperature()) {
			valid.push_back(*reading.temperature);
		}
	}
	return valid;
}

std::vector<double> sanitize(const std::vector<AnnotatedReading> &points) {
	std::vector<double> valid;
	valid.reserve(points.size());
	for (const auto &point : points) {
		if (point.reading.hasUsableTemperature()) {
			valid.push_back(*point.reading.temperature);
		}
	}
	return valid;
}

} // namespace thermocast::core
