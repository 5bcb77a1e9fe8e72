#pragma once
// Univariate Gaussian kernel density estimate with Scott's rule bandwidth.
//
//   factor = n^(-1/5)
//   h^2    = var(samples, ddof=1) * factor^2
//   pdf(x) = 1/n * sum_i N(x; x_i, h^2)
//
// Grid evaluation is parallel over grid points (OpenMP when available);
// each point's kernel sum is accumulated in sample order.

#include <cstddef>
#include <memory>
#include <vector>

#include "evbkit/density.hpp"

namespace evbkit {

class GaussianKde : public DensityFunction {
public:
    // Throws EstimatorError for < 2 samples, non-finite samples or zero variance.
    explicit GaussianKde(std::vector<double> samples);

    double evaluate(double x) const override;
    std::vector<double> evaluate_grid(const std::vector<double>& xs) const override;

    double bandwidth() const noexcept { return bandwidth_; }
    double scott_factor() const noexcept { return factor_; }
    size_t num_samples() const noexcept { return samples_.size(); }

private:
    std::vector<double> samples_;
    double factor_ = 0.0;
    double bandwidth_ = 0.0;
    double norm_ = 0.0;      // 1 / (n * h * sqrt(2 pi))
    double inv_two_var_ = 0.0;
};

class GaussianKdeEstimator : public DensityEstimator {
public:
    std::shared_ptr<const DensityFunction> fit(const std::vector<double>& samples) const override;
};

}  // namespace evbkit
