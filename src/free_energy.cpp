#include "evbkit/free_energy.hpp"
#include "evbkit/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace evbkit {

namespace {

void require_bins(size_t nbins) {
    if (nbins < 1) {
        throw std::invalid_argument("Number of bins must be >= 1");
    }
}

void require_samples(const AmplitudeSamples& samples) {
    if (samples.size() == 0) {
        throw EmptyTrajectoryError();
    }
}

std::vector<double> negated(const std::vector<double>& v) {
    std::vector<double> out(v.size());
    for (size_t i = 0; i < v.size(); ++i) out[i] = -v[i];
    return out;
}

}  // namespace

const char* profile_mode_to_string(ProfileMode mode) {
    switch (mode) {
        case ProfileMode::SINGLE_ENERGY:     return "free-energy";
        case ProfileMode::DIFFERENCE_ENERGY: return "free-energy-difference";
        default: return "density";
    }
}

std::vector<double> linspace(double lo, double hi, size_t n) {
    std::vector<double> xs;
    if (n == 0) return xs;
    xs.reserve(n);
    if (n == 1) {
        xs.push_back(lo);
        return xs;
    }
    const double step = (hi - lo) / static_cast<double>(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) {
        xs.push_back(lo + static_cast<double>(i) * step);
    }
    xs.push_back(hi);
    return xs;
}

double boltzmann_energy(double coordinate, double density) {
    if (!(density > 0.0) || !std::isfinite(density)) {
        throw DensityDomainError(coordinate, density);
    }
    return -kBoltzmannKcalMolK * kTemperature * std::log(density);
}

void shift_to_zero_minimum(EnergyProfile& profile) {
    if (profile.empty()) return;
    auto it = std::min_element(profile.begin(), profile.end(),
                               [](const ProfilePoint& a, const ProfilePoint& b) {
                                   return a.energy < b.energy;
                               });
    const double min_energy = it->energy;
    for (auto& p : profile) {
        p.energy -= min_energy;
    }
}

EnergyProfile energy_over_grid(const DensityFunction& pdf, const std::vector<double>& grid) {
    const std::vector<double> dens = pdf.evaluate_grid(grid);

    EnergyProfile profile;
    profile.reserve(grid.size());
    for (size_t i = 0; i < grid.size(); ++i) {
        profile.push_back({grid[i], boltzmann_energy(grid[i], dens[i])});
    }
    return profile;
}

EnergyProfile difference_energy_over_grid(const DensityFunction& pdf_direct,
                                          const DensityFunction& pdf_negated,
                                          const std::vector<double>& grid) {
    // Evaluate each density only on its own side of the dead zone.
    std::vector<double> lower_x, upper_x;
    for (double x : grid) {
        if (x < -kDeadZoneHalfWidth) lower_x.push_back(x);
        else if (x > kDeadZoneHalfWidth) upper_x.push_back(x);
    }
    const std::vector<double> lower_d = pdf_negated.evaluate_grid(lower_x);
    const std::vector<double> upper_d = pdf_direct.evaluate_grid(upper_x);

    EnergyProfile profile;
    profile.reserve(grid.size());
    size_t li = 0, ui = 0;
    for (double x : grid) {
        double g = 0.0;
        if (x < -kDeadZoneHalfWidth) {
            g = boltzmann_energy(x, lower_d[li++]);
        } else if (x > kDeadZoneHalfWidth) {
            g = boltzmann_energy(x, upper_d[ui++]);
        }
        profile.push_back({x, g});
    }
    return profile;
}

FreeEnergyProfiler::FreeEnergyProfiler(std::shared_ptr<const DensityEstimator> estimator)
    : estimator_(std::move(estimator)) {
    if (!estimator_) {
        throw std::invalid_argument("FreeEnergyProfiler requires a density estimator");
    }
}

DensityProfile FreeEnergyProfiler::density_profile(const AmplitudeSamples& samples,
                                                   size_t nbins) const {
    require_bins(nbins);
    require_samples(samples);

    auto pdf1 = estimator_->fit(samples.dominant_sq);
    auto pdf2 = estimator_->fit(samples.secondary_sq);

    const std::vector<double> grid = linspace(0.0, 1.0, nbins);
    const std::vector<double> d1 = pdf1->evaluate_grid(grid);
    const std::vector<double> d2 = pdf2->evaluate_grid(grid);

    DensityProfile profile(grid.size());
    for (size_t i = 0; i < grid.size(); ++i) {
        profile[i].coordinate = grid[i];
        profile[i].dominant = d1[i];
        profile[i].secondary = d2[i];
    }
    return profile;
}

EnergyProfile FreeEnergyProfiler::single_energy_unshifted(const AmplitudeSamples& samples,
                                                          size_t nbins) const {
    require_bins(nbins);
    require_samples(samples);
    auto pdf = estimator_->fit(samples.dominant_sq);
    return energy_over_grid(*pdf, linspace(0.0, 1.0, nbins));
}

EnergyProfile FreeEnergyProfiler::difference_energy_unshifted(const AmplitudeSamples& samples,
                                                              size_t nbins) const {
    require_bins(nbins);
    require_samples(samples);
    const std::vector<double> diff = samples.difference();
    auto pdf_direct = estimator_->fit(diff);
    auto pdf_negated = estimator_->fit(negated(diff));
    return difference_energy_over_grid(*pdf_direct, *pdf_negated,
                                       linspace(-1.0, 1.0, 2 * nbins));
}

EnergyProfile FreeEnergyProfiler::single_energy_profile(const AmplitudeSamples& samples,
                                                        size_t nbins) const {
    EnergyProfile profile = single_energy_unshifted(samples, nbins);
    shift_to_zero_minimum(profile);
    return profile;
}

EnergyProfile FreeEnergyProfiler::difference_energy_profile(const AmplitudeSamples& samples,
                                                            size_t nbins) const {
    EnergyProfile profile = difference_energy_unshifted(samples, nbins);
    shift_to_zero_minimum(profile);
    return profile;
}

EnergyProfile FreeEnergyProfiler::energy_profile(ProfileMode mode,
                                                 const AmplitudeSamples& samples,
                                                 size_t nbins) const {
    switch (mode) {
        case ProfileMode::SINGLE_ENERGY:
            return single_energy_profile(samples, nbins);
        case ProfileMode::DIFFERENCE_ENERGY:
            return difference_energy_profile(samples, nbins);
        default:
            throw std::invalid_argument("Density mode has no energy profile");
    }
}

}  // namespace evbkit
