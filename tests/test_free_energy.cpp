// tests/test_free_energy.cpp
//
// Free energy profiler with deterministic stub densities:
//   - constants and grid construction
//   - single mode: energies follow -kT ln pdf and the minimum is exactly 0
//   - difference mode: side selection, dead zone is exactly 0 before the
//     shift, densities are never evaluated inside the dead zone
//   - non-positive or non-finite density raises DensityDomainError with the
//     offending coordinate
//   - argument validation

#include "evbkit/errors.hpp"
#include "evbkit/free_energy.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

const double kT = evbkit::kBoltzmannKcalMolK * evbkit::kTemperature;

// Density given by a plain function of x.
class FnDensity : public evbkit::DensityFunction {
public:
    explicit FnDensity(std::function<double(double)> fn) : fn_(std::move(fn)) {}
    double evaluate(double x) const override { return fn_(x); }

private:
    std::function<double(double)> fn_;
};

// Hands out `positive` when the fitted samples have positive mean and
// `negative` otherwise, so tests can tell which sample set fed which side.
class SignEstimator : public evbkit::DensityEstimator {
public:
    SignEstimator(std::function<double(double)> positive, std::function<double(double)> negative)
        : positive_(std::move(positive)), negative_(std::move(negative)) {}

    std::shared_ptr<const evbkit::DensityFunction> fit(const std::vector<double>& samples) const override {
        ++fits;
        const double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
        return std::make_shared<FnDensity>(sum > 0.0 ? positive_ : negative_);
    }

    mutable int fits = 0;

private:
    std::function<double(double)> positive_;
    std::function<double(double)> negative_;
};

evbkit::AmplitudeSamples make_samples() {
    evbkit::AmplitudeSamples s;
    s.dominant_sq = {0.64, 0.49, 0.81, 0.56, 0.72};
    s.secondary_sq = {0.09, 0.16, 0.04, 0.12, 0.10};
    return s;
}

double min_energy(const evbkit::EnergyProfile& p) {
    double m = std::numeric_limits<double>::infinity();
    for (const auto& pt : p) m = std::min(m, pt.energy);
    return m;
}

int test_constants_and_grid() {
    std::cout << "Testing constants and grids...\n";
    int failed = 0;

    expect(std::abs(evbkit::kBoltzmannKcalMolK - 1.3806488e-23 / 6.9477e-21) < 1e-18,
           "kB in kcal/mol/K", failed);
    expect(std::abs(kT - 0.59616) < 1e-4, "kT at 300 K is about 0.596 kcal/mol", failed);

    auto g = evbkit::linspace(0.0, 1.0, 5);
    expect(g.size() == 5, "linspace size", failed);
    expect(g.front() == 0.0 && g.back() == 1.0, "linspace includes both ends", failed);
    expect(std::abs(g[2] - 0.5) < 1e-15, "linspace midpoint", failed);

    g = evbkit::linspace(-1.0, 1.0, 1);
    expect(g.size() == 1 && g[0] == -1.0, "linspace with one point gives the lower end", failed);
    expect(evbkit::linspace(0.0, 1.0, 0).empty(), "linspace with zero points is empty", failed);

    expect(std::abs(evbkit::boltzmann_energy(0.3, 1.0)) < 1e-15, "ln(1) gives zero energy", failed);
    expect(std::abs(evbkit::boltzmann_energy(0.3, std::exp(-1.0)) - kT) < 1e-12,
           "pdf = 1/e gives kT", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_single_mode() {
    std::cout << "Testing single-coordinate mode...\n";
    int failed = 0;

    auto gauss = [](double x) { return std::exp(-(x - 0.6) * (x - 0.6) / 0.02) + 1e-3; };
    auto est = std::make_shared<SignEstimator>(gauss, gauss);
    evbkit::FreeEnergyProfiler profiler(est);

    const auto samples = make_samples();
    const auto raw = profiler.single_energy_unshifted(samples, 11);
    const auto prof = profiler.single_energy_profile(samples, 11);

    expect(prof.size() == 11, "nbins points", failed);
    expect(prof.front().coordinate == 0.0 && prof.back().coordinate == 1.0, "grid spans [0,1]", failed);
    expect(min_energy(prof) == 0.0, "minimum energy is exactly 0", failed);

    // Minimum sits at the density peak (x = 0.6)
    auto it = std::min_element(prof.begin(), prof.end(),
                               [](const evbkit::ProfilePoint& a, const evbkit::ProfilePoint& b) {
                                   return a.energy < b.energy;
                               });
    expect(std::abs(it->coordinate - 0.6) < 1e-9, "minimum at the density maximum", failed);

    // Relative energies are preserved by the shift and follow -kT ln pdf
    for (size_t i = 0; i < raw.size(); ++i) {
        const double expected_raw = -kT * std::log(gauss(raw[i].coordinate));
        if (std::abs(raw[i].energy - expected_raw) > 1e-12) {
            expect(false, "raw energy mismatch at index " + std::to_string(i), failed);
            break;
        }
        const double d_raw = raw[i].energy - raw[0].energy;
        const double d_prof = prof[i].energy - prof[0].energy;
        if (std::abs(d_raw - d_prof) > 1e-12) {
            expect(false, "shift changed a relative energy at index " + std::to_string(i), failed);
            break;
        }
    }

    expect(est->fits == 2, "one fit per profile call", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_difference_mode() {
    std::cout << "Testing difference mode...\n";
    int failed = 0;

    // direct side (c1^2 - c2^2 > 0) gets pdf 2, negated side pdf 0.5
    auto est = std::make_shared<SignEstimator>([](double) { return 2.0; },
                                               [](double) { return 0.5; });
    evbkit::FreeEnergyProfiler profiler(est);
    const auto samples = make_samples();

    const size_t nbins = 200;
    const auto raw = profiler.difference_energy_unshifted(samples, nbins);
    expect(raw.size() == 2 * nbins, "2*nbins points", failed);
    expect(raw.front().coordinate == -1.0 && raw.back().coordinate == 1.0, "grid spans [-1,1]", failed);

    size_t in_zone = 0;
    for (const auto& p : raw) {
        const double x = p.coordinate;
        if (x >= -evbkit::kDeadZoneHalfWidth && x <= evbkit::kDeadZoneHalfWidth) {
            ++in_zone;
            if (p.energy != 0.0) {
                expect(false, "dead zone energy not exactly 0 at x=" + std::to_string(x), failed);
                break;
            }
        } else if (x > evbkit::kDeadZoneHalfWidth) {
            if (std::abs(p.energy - (-kT * std::log(2.0))) > 1e-12) {
                expect(false, "x > 0.04 must use the direct-difference density", failed);
                break;
            }
        } else {
            if (std::abs(p.energy - (-kT * std::log(0.5))) > 1e-12) {
                expect(false, "x < -0.04 must use the negated-difference density", failed);
                break;
            }
        }
    }
    expect(in_zone > 0, "grid has points inside the dead zone", failed);

    const auto prof = profiler.difference_energy_profile(samples, nbins);
    expect(min_energy(prof) == 0.0, "minimum energy is exactly 0 after the shift", failed);
    // The direct side is the global minimum here, so the dead zone moves up
    for (const auto& p : prof) {
        if (p.coordinate >= -0.04 && p.coordinate <= 0.04) {
            expect(std::abs(p.energy - kT * std::log(2.0)) < 1e-12,
                   "shifted dead zone sits at kT ln 2", failed);
            break;
        }
    }

    expect(est->fits == 4, "two fits per difference profile", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_dead_zone_not_evaluated() {
    std::cout << "Testing that the dead zone is never evaluated...\n";
    int failed = 0;

    // Density vanishes inside the dead zone; the profile must still succeed
    auto zero_inside = [](double x) {
        return std::abs(x) <= evbkit::kDeadZoneHalfWidth ? 0.0 : 1.0 + x * x;
    };
    auto est = std::make_shared<SignEstimator>(zero_inside, zero_inside);
    evbkit::FreeEnergyProfiler profiler(est);

    bool threw = false;
    evbkit::EnergyProfile prof;
    try {
        prof = profiler.difference_energy_profile(make_samples(), 50);
    } catch (const evbkit::DensityDomainError&) {
        threw = true;
    }
    expect(!threw, "dead zone coordinates must not reach the logarithm", failed);
    expect(prof.size() == 100, "profile produced", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_density_domain_error() {
    std::cout << "Testing density domain errors...\n";
    int failed = 0;

    // Tail underflow: zero for x >= 0.95, first offending grid point is 1.0
    {
        auto tail = [](double x) { return x >= 0.95 ? 0.0 : 1.0; };
        evbkit::FreeEnergyProfiler profiler(std::make_shared<SignEstimator>(tail, tail));
        bool threw = false;
        try {
            (void)profiler.single_energy_profile(make_samples(), 11);
        } catch (const evbkit::DensityDomainError& e) {
            threw = true;
            expect(e.coordinate() == 1.0, "error carries coordinate 1.0", failed);
            expect(e.density() == 0.0, "error carries the density value", failed);
        }
        expect(threw, "zero density must throw DensityDomainError", failed);
    }

    // Negative density on the negated side of the difference grid
    {
        auto pos = [](double) { return 1.0; };
        auto neg = [](double x) { return x < -0.5 ? -1e-9 : 1.0; };
        evbkit::FreeEnergyProfiler profiler(std::make_shared<SignEstimator>(pos, neg));
        bool threw = false;
        try {
            (void)profiler.difference_energy_profile(make_samples(), 10);
        } catch (const evbkit::DensityDomainError& e) {
            threw = true;
            expect(e.coordinate() == -1.0, "lowest offending coordinate is reported", failed);
        }
        expect(threw, "negative density must throw DensityDomainError", failed);
    }

    // NaN density
    {
        auto nan = [](double) { return std::numeric_limits<double>::quiet_NaN(); };
        evbkit::FreeEnergyProfiler profiler(std::make_shared<SignEstimator>(nan, nan));
        bool threw = false;
        try {
            (void)profiler.single_energy_profile(make_samples(), 3);
        } catch (const evbkit::DensityDomainError&) {
            threw = true;
        }
        expect(threw, "NaN density must throw DensityDomainError", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_modes_and_validation() {
    std::cout << "Testing mode dispatch and validation...\n";
    int failed = 0;

    auto one = [](double) { return 1.0; };
    auto est = std::make_shared<SignEstimator>(one, [](double) { return 3.0; });
    evbkit::FreeEnergyProfiler profiler(est);
    const auto samples = make_samples();

    const auto d = profiler.density_profile(samples, 21);
    expect(d.size() == 21, "density profile has nbins points", failed);
    expect(d.front().coordinate == 0.0 && d.back().coordinate == 1.0, "density grid spans [0,1]", failed);
    expect(d[5].dominant == 1.0 && d[5].secondary == 1.0, "density values come from the fitted pdfs", failed);

    auto single = profiler.energy_profile(evbkit::ProfileMode::SINGLE_ENERGY, samples, 4);
    expect(single.size() == 4, "SINGLE_ENERGY dispatch", failed);
    auto diff = profiler.energy_profile(evbkit::ProfileMode::DIFFERENCE_ENERGY, samples, 4);
    expect(diff.size() == 8, "DIFFERENCE_ENERGY dispatch", failed);

    bool threw = false;
    try {
        (void)profiler.energy_profile(evbkit::ProfileMode::DENSITY, samples, 4);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "DENSITY has no energy profile", failed);

    threw = false;
    try {
        (void)profiler.single_energy_profile(samples, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "zero bins rejected", failed);

    threw = false;
    try {
        (void)profiler.single_energy_profile(evbkit::AmplitudeSamples(), 10);
    } catch (const evbkit::EmptyTrajectoryError&) {
        threw = true;
    }
    expect(threw, "empty sample set rejected", failed);

    evbkit::EnergyProfile empty;
    evbkit::shift_to_zero_minimum(empty);
    expect(empty.empty(), "shifting an empty profile is a no-op", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_constants_and_grid();
    total += test_single_mode();
    total += test_difference_mode();
    total += test_dead_zone_not_evaluated();
    total += test_density_domain_error();
    total += test_modes_and_validation();

    if (total == 0) {
        std::cout << "\nAll free energy tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
