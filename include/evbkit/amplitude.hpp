#pragma once
// Dominant / secondary CI amplitude extraction.
//
// For each frame the largest and second largest coefficient are selected in
// one pass and squared (state occupation probabilities). A tie with the
// current maximum shifts the old maximum into the second slot, so a vector
// with two equal leading coefficients reports c1^2 == c2^2.
//
// Ranking uses the signed coefficients, not their magnitudes. The ordering
// c1^2 >= c2^2 therefore holds only for non-negative CI vectors (the MS-EVB
// ground state); for {-0.9, -0.3, -0.1} the result is c1^2 = 0.01,
// c2^2 = 0.09.

#include <cstddef>
#include <vector>

#include "evbkit/types.hpp"

namespace evbkit {

// Throws InsufficientStatesError (frame index 0) for fewer than 2 amplitudes.
AmplitudePair top_two_squared(const std::vector<double>& amplitudes);

// Same, reporting `frame` in the error.
AmplitudePair top_two_squared(const std::vector<double>& amplitudes, size_t frame);

// Applies top_two_squared to every frame. Fails on the first frame with
// fewer than two states; no partial result is returned.
AmplitudeSamples extract_amplitudes(const std::vector<std::vector<double>>& amplitude_vectors);

}  // namespace evbkit
