#pragma once
// Core value types shared by the trajectory analyses.
//
// A trajectory arrives as three frame-aligned columns (timestep, CI vector,
// reaction center). Everything downstream is a plain vector indexed by frame.

#include <cstddef>
#include <cstdint>
#include <vector>

namespace evbkit {

using Timestep = int64_t;
using CenterId = int64_t;

// Frame-aligned columns produced by the trajectory reader.
// Alignment is by index, not by timestep value.
struct TrajectoryColumns {
    std::vector<Timestep> timesteps;
    std::vector<std::vector<double>> amplitude_vectors;
    std::vector<CenterId> centers;

    size_t num_frames() const noexcept { return timesteps.size(); }
};

// Squared largest and second largest CI coefficient of one frame.
// Invariant: dominant_sq >= secondary_sq >= 0.
struct AmplitudePair {
    double dominant_sq = 0.0;
    double secondary_sq = 0.0;
};

// Per-frame squared amplitudes, one entry per frame in both vectors.
struct AmplitudeSamples {
    std::vector<double> dominant_sq;
    std::vector<double> secondary_sq;

    size_t size() const noexcept { return dominant_sq.size(); }

    // c1^2 - c2^2 per frame
    std::vector<double> difference() const {
        std::vector<double> d(dominant_sq.size());
        for (size_t i = 0; i < d.size(); ++i) {
            d[i] = dominant_sq[i] - secondary_sq[i];
        }
        return d;
    }
};

enum class HopEvent : uint8_t {
    NONE,      // same center as the previous frame
    FORWARD,   // proton moved to a new acceptor
    BACKWARD   // proton returned to the most recent donor
};

inline const char* hop_event_to_string(HopEvent e) {
    switch (e) {
        case HopEvent::FORWARD:  return "forward";
        case HopEvent::BACKWARD: return "backward";
        default: return "none";
    }
}

// Output of the hop classifier. counts[0] == 0 and events[0] == NONE.
struct HopTrace {
    std::vector<int64_t> counts;
    std::vector<HopEvent> events;
    uint64_t n_forward = 0;
    uint64_t n_backward = 0;

    int64_t net_displacement() const noexcept {
        return counts.empty() ? 0 : counts.back();
    }
};

struct ProfilePoint {
    double coordinate = 0.0;
    double energy = 0.0;     // kcal/mol
};

using EnergyProfile = std::vector<ProfilePoint>;

// Probability density of c1^2 and c2^2 at one grid coordinate.
struct DensityPoint {
    double coordinate = 0.0;
    double dominant = 0.0;
    double secondary = 0.0;
};

using DensityProfile = std::vector<DensityPoint>;

}  // namespace evbkit
