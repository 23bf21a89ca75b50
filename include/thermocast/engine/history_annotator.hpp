#pragma once

#include "thermocast/core/reading.hpp"
#include "thermocast/engine/forecast_dispatcher.hpp"
#include <cstddef>
#include <vector>

namespace thermocast::engine {

/**
 * @class HistoryAnnotator
 * @brief Fills in a forecast for every point of a historical series.
 *
 * The forecast for point i is exactly what the dispatcher returns for
 * history = points[0..i-1] and current = points[i]; nothing after i is read.
 * Points that already carry a predicted temperature are copied through
 * untouched. Each point costs at most one model window of work, independent
 * of the series length.
 */
class HistoryAnnotator {
public:
	/// Readings used by annotateLatest(), matching what the backend job fetched.
	static constexpr std::size_t kLatestHistoryLimit = 100;

	explicit HistoryAnnotator(ForecastDispatcher dispatcher);

	explicit HistoryAnnotator(PredictionOptions options,
	                          std::shared_ptr<utils::RandomSource> random = utils::defaultRandomSource());

	/**
	 * @brief Annotates @p points in order. Empty input yields empty output.
	 */
	std::vector<core::AnnotatedReading> annotate(const std::vector<core::AnnotatedReading> &points) const;

	/// Convenience overload for readings without any precomputed forecast.
	std::vector<core::AnnotatedReading> annotate(const std::vector<core::Reading> &readings) const;

	/**
	 * @brief Forecast for the newest reading, stamped with @p now.
	 *
	 * Only the last kLatestHistoryLimit entries of @p history are used. When the
	 * newest history entry is @p latest itself (same timestamp), it is skipped so
	 * the current point is not counted twice.
	 */
	core::AnnotatedReading annotateLatest(const std::vector<core::Reading> &history, const core::Reading &latest,
	                                      core::Reading::TimePoint now) const;

	const ForecastDispatcher &dispatcher() const {
		return dispatcher_;
	}

private:
	ForecastDispatcher dispatcher_;
};

} // namespace thermocast::engine
