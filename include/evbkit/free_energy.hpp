#pragma once
// Free energy profiles from fitted amplitude densities.
//
//   dG(x) = -kB * T * ln(pdf(x))      [kcal/mol], T = 300 K
//
// Single mode:     nbins points over [0, 1], pdf fitted to c1^2.
// Difference mode: 2*nbins points over [-1, 1]; pdf fitted to c1^2 - c2^2
//                  for x > 0.04, to c2^2 - c1^2 for x < -0.04, and dG = 0
//                  inside the dead zone [-0.04, 0.04].
// Both modes shift the profile so that its minimum is exactly 0.

#include <cstddef>
#include <memory>
#include <vector>

#include "evbkit/density.hpp"
#include "evbkit/types.hpp"

namespace evbkit {

constexpr double kBoltzmannJoulePerKelvin = 1.3806488e-23;
constexpr double kJoulePerKcalMol = 6.9477e-21;   // 1 kcal/mol per molecule
constexpr double kBoltzmannKcalMolK = kBoltzmannJoulePerKelvin / kJoulePerKcalMol;
constexpr double kTemperature = 300.0;
constexpr double kDeadZoneHalfWidth = 0.04;

enum class ProfileMode {
    DENSITY,            // pdf of c1^2 and c2^2, no energy transform
    SINGLE_ENERGY,      // dG over c1^2
    DIFFERENCE_ENERGY   // dG over c1^2 - c2^2
};

const char* profile_mode_to_string(ProfileMode mode);

// n evenly spaced points including both ends; n == 1 gives {lo}.
std::vector<double> linspace(double lo, double hi, size_t n);

// -kB*T*ln(density). Throws DensityDomainError unless density > 0 and finite.
double boltzmann_energy(double coordinate, double density);

// Subtracts min(energy) from every point; no-op on an empty profile.
void shift_to_zero_minimum(EnergyProfile& profile);

class FreeEnergyProfiler {
public:
    explicit FreeEnergyProfiler(std::shared_ptr<const DensityEstimator> estimator);

    DensityProfile density_profile(const AmplitudeSamples& samples, size_t nbins) const;

    EnergyProfile single_energy_profile(const AmplitudeSamples& samples, size_t nbins) const;
    EnergyProfile difference_energy_profile(const AmplitudeSamples& samples, size_t nbins) const;

    // Before the zero-minimum shift
    EnergyProfile single_energy_unshifted(const AmplitudeSamples& samples, size_t nbins) const;
    EnergyProfile difference_energy_unshifted(const AmplitudeSamples& samples, size_t nbins) const;

    // Energy modes only; DENSITY throws std::invalid_argument.
    EnergyProfile energy_profile(ProfileMode mode, const AmplitudeSamples& samples,
                                 size_t nbins) const;

private:
    std::shared_ptr<const DensityEstimator> estimator_;
};

// Profiles over an already-fitted density, used by the profiler and by
// callers that own their densities.
EnergyProfile energy_over_grid(const DensityFunction& pdf, const std::vector<double>& grid);

EnergyProfile difference_energy_over_grid(const DensityFunction& pdf_direct,
                                          const DensityFunction& pdf_negated,
                                          const std::vector<double>& grid);

}  // namespace evbkit
