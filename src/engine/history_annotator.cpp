#include "thermocast/engine/history_annotator.hpp"
#include "thermocast/utils/logging.hpp"
#include <algorithm>
#include <cstddef>
#include <utility>

namespace thermocast::engine {

HistoryAnnotator::HistoryAnnotator(ForecastDispatcher dispatcher) : dispatcher_(std::move(dispatcher)) {
}

HistoryAnnotator::HistoryAnnotator(PredictionOptions options, std::shared_ptr<utils::RandomSource> random)
    : dispatcher_(std::move(options), std::move(random)) {
}

std::vector<core::AnnotatedReading>
HistoryAnnotator::annotate(const std::vector<core::AnnotatedReading> &points) const {
	std::vector<core::AnnotatedReading> annotated;
	if (points.empty()) {
		return annotated;
	}
	annotated.reserve(points.size());

	// Usable temperatures strictly before the current index, grown as we go.
	std::vector<double> past;
	past.reserve(points.size());

	std::size_t preserved = 0;
	for (const auto &point : points) {
		core::AnnotatedReading out = point;
		if (point.predicted_temperature.has_value()) {
			++preserved;
		} else {
			out.predicted_temperature = dispatcher_.forecastSanitized(past, point.reading.temperature);
		}
		annotated.push_back(std::move(out));

		if (point.reading.hasUsableTemperature()) {
			past.push_back(*point.reading.temperature);
		}
	}

	THERMOCAST_DEBUG("Annotated {} points with {} forecasts ({} precomputed kept, {} usable temperatures).",
	                 points.size(), models::methodName(dispatcher_.options().method), preserved, past.size());
	return annotated;
}

std::vector<core::AnnotatedReading> HistoryAnnotator::annotate(const std::vector<core::Reading> &readings) const {
	std::vector<core::AnnotatedReading> points;
	points.reserve(readings.size());
	for (const auto &reading : readings) {
		points.emplace_back(reading);
	}
	return annotate(points);
}

core::AnnotatedReading HistoryAnnotator::annotateLatest(const std::vector<core::Reading> &history,
                                                        const core::Reading &latest,
                                                        core::Reading::TimePoint now) const {
	auto end = history.end();
	if (!history.empty() && history.back().timestamp == latest.timestamp) {
		--end;
	}
	const auto available = static_cast<std::size_t>(end - history.begin());
	const auto begin = end - static_cast<std::ptrdiff_t>(std::min(available, kLatestHistoryLimit));
	const std::vector<core::Reading> recent(begin, end);

	core::AnnotatedReading result(latest);
	result.predicted_temperature = dispatcher_.forecastOne(recent, latest);
	result.predicted_at = now;
	THERMOCAST_DEBUG("Latest reading forecast {} from {} history readings.", *result.predicted_temperature,
	                 recent.size());
	return result;
}

} // namespace thermocast::engine
