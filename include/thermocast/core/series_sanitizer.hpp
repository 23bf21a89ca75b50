#pragma once

#include "thermocast/core/reading.hpp"

#include <optional>
#include <vector>

namespace thermocast::core {

/**
 * @brief Filters raw temperatures down to the usable ones.
 *
 * Keeps values that are finite and strictly greater than zero, in their
 * original order. Order is the causal time axis, so nothing is sorted and
 * repeated values are kept. Empty input yields empty output.
 */
std::vector<double> sanitize(const std::vector<double> &raw);

/// Same as above; absent values are dropped.
std::vector<double> sanitize(const std::vector<std::optional<double>> &raw);

/// Extracts the usable temperatures of a reading sequence, oldest first.
std::vector<double> sanitize(const std::vector<Reading> &readings);

/// Extracts the usable temperatures of an annotated sequence, oldest first.
std::vector<double> sanitize(const std::vector<AnnotatedReading> &points);

} // namespace thermocast::core
