#pragma once
// Density estimation seam.
//
// The free energy profiler only needs a fitted, immutable density that can
// be evaluated at grid coordinates. The estimator behind it is injected so
// tests can substitute deterministic densities.

#include <memory>
#include <vector>

namespace evbkit {

class DensityFunction {
public:
    virtual ~DensityFunction() = default;

    virtual double evaluate(double x) const = 0;

    // Batch evaluation; one value per coordinate, same order.
    virtual std::vector<double> evaluate_grid(const std::vector<double>& xs) const {
        std::vector<double> out(xs.size());
        for (size_t i = 0; i < xs.size(); ++i) {
            out[i] = evaluate(xs[i]);
        }
        return out;
    }
};

class DensityEstimator {
public:
    virtual ~DensityEstimator() = default;

    // Fitted once; the returned density is never mutated.
    virtual std::shared_ptr<const DensityFunction> fit(const std::vector<double>& samples) const = 0;
};

}  // namespace evbkit
