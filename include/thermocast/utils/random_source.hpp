#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace thermocast::utils {

/**
 * @class RandomSource
 * @brief Source of uniform draws used to break ties in the nudge direction.
 *
 * The engine asks for a draw only when the most recent delta of a series is
 * exactly zero. Implementations must be safe to call from several threads.
 */
class RandomSource {
public:
	virtual ~RandomSource() = default;

	/// Returns a value uniformly distributed in [0, 1).
	virtual double uniform() = 0;
};

/**
 * @class SeededRandomSource
 * @brief Mersenne Twister backed source; draws are serialized with a mutex.
 */
class SeededRandomSource final : public RandomSource {
public:
	explicit SeededRandomSource(std::uint64_t seed) : engine_(seed) {
	}

	double uniform() override {
		std::lock_guard<std::mutex> lock(mutex_);
		return distribution_(engine_);
	}

private:
	std::mutex mutex_;
	std::mt19937_64 engine_;
	std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

/**
 * @class FixedRandomSource
 * @brief Always returns the same draw. Lets callers pin the tie-break direction.
 */
class FixedRandomSource final : public RandomSource {
public:
	explicit FixedRandomSource(double value) : value_(value) {
	}

	double uniform() override {
		return value_;
	}

private:
	double value_;
};

/**
 * @brief Process-wide source seeded from std::random_device on first use.
 */
std::shared_ptr<RandomSource> defaultRandomSource();

} // namespace thermocast::utils
