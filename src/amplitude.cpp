#include "evbkit/amplitude.hpp"
#include "evbkit/errors.hpp"

#include <optional>

namespace evbkit {

AmplitudePair top_two_squared(const std::vector<double>& amplitudes) {
    return top_two_squared(amplitudes, 0);
}

AmplitudePair top_two_squared(const std::vector<double>& amplitudes, size_t frame) {
    // Unset slots compare as a lower bound for every value.
    std::optional<double> m1;
    std::optional<double> m2;

    for (double x : amplitudes) {
        if (!m1 || x >= *m1) {
            m2 = m1;
            m1 = x;
        } else if (!m2 || x > *m2) {
            m2 = x;
        }
    }

    if (!m2) {
        throw InsufficientStatesError(frame, amplitudes.size());
    }

    AmplitudePair pair;
    pair.dominant_sq = (*m1) * (*m1);
    pair.secondary_sq = (*m2) * (*m2);
    return pair;
}

AmplitudeSamples extract_amplitudes(const std::vector<std::vector<double>>& amplitude_vectors) {
    AmplitudeSamples samples;
    samples.dominant_sq.reserve(amplitude_vectors.size());
    samples.secondary_sq.reserve(amplitude_vectors.size());

    for (size_t f = 0; f < amplitude_vectors.size(); ++f) {
        const AmplitudePair p = top_two_squared(amplitude_vectors[f], f);
        samples.dominant_sq.push_back(p.dominant_sq);
        samples.secondary_sq.push_back(p.secondary_sq);
    }
    return samples;
}

}  // namespace evbkit
