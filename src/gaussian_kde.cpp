#include "evbkit/gaussian_kde.hpp"
#include "evbkit/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace evbkit {

namespace {

constexpr double kSqrtTwoPi = 2.5066282746310002;

}  // namespace

GaussianKde::GaussianKde(std::vector<double> samples)
    : samples_(std::move(samples)) {
    const size_t n = samples_.size();
    if (n < 2) {
        throw EstimatorError("Kernel density needs at least 2 samples, got " +
                             std::to_string(n));
    }

    double mean = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(samples_[i])) {
            throw EstimatorError("Non-finite sample at index " + std::to_string(i));
        }
        mean += samples_[i];
    }
    mean /= static_cast<double>(n);

    double ss = 0.0;
    for (double x : samples_) {
        const double d = x - mean;
        ss += d * d;
    }
    const double var = ss / static_cast<double>(n - 1);
    if (!(var > 0.0)) {
        throw EstimatorError("Samples have zero variance; kernel density is singular");
    }

    factor_ = std::pow(static_cast<double>(n), -0.2);
    const double kernel_var = var * factor_ * factor_;
    bandwidth_ = std::sqrt(kernel_var);
    norm_ = 1.0 / (static_cast<double>(n) * bandwidth_ * kSqrtTwoPi);
    inv_two_var_ = 1.0 / (2.0 * kernel_var);
}

double GaussianKde::evaluate(double x) const {
    double sum = 0.0;
    for (double xi : samples_) {
        const double d = x - xi;
        sum += std::exp(-d * d * inv_two_var_);
    }
    return sum * norm_;
}

std::vector<double> GaussianKde::evaluate_grid(const std::vector<double>& xs) const {
    std::vector<double> out(xs.size(), 0.0);
    const int64_t n = static_cast<int64_t>(xs.size());

    #pragma omp parallel for schedule(static)
    for (int64_t i = 0; i < n; ++i) {
        out[i] = evaluate(xs[i]);
    }
    return out;
}

std::shared_ptr<const DensityFunction> GaussianKdeEstimator::fit(const std::vector<double>& samples) const {
    return std::make_shared<GaussianKde>(samples);
}

}  // namespace evbkit
