#pragma once
// Failure kinds raised by the analyses.
//
// None of these is recoverable where it is detected: a malformed or
// statistically degenerate trajectory has no meaningful partial result.
// Each error carries the frame index or coordinate that triggered it.

#include <cstddef>
#include <stdexcept>
#include <string>

#include "evbkit/types.hpp"

namespace evbkit {

class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(const std::string& what) : std::runtime_error(what) {}
};

// A CI vector with fewer than two states has no second-largest amplitude.
class InsufficientStatesError : public AnalysisError {
public:
    InsufficientStatesError(size_t frame, size_t n_states);

    size_t frame() const noexcept { return frame_; }
    size_t n_states() const noexcept { return n_states_; }

private:
    size_t frame_;
    size_t n_states_;
};

class EmptyTrajectoryError : public AnalysisError {
public:
    EmptyTrajectoryError() : AnalysisError("Trajectory contains no frames") {}
};

class MismatchedLengthError : public AnalysisError {
public:
    MismatchedLengthError(size_t n_timesteps, size_t n_amplitude_vectors, size_t n_centers);

    size_t n_timesteps() const noexcept { return n_timesteps_; }
    size_t n_amplitude_vectors() const noexcept { return n_amplitude_vectors_; }
    size_t n_centers() const noexcept { return n_centers_; }

private:
    size_t n_timesteps_;
    size_t n_amplitude_vectors_;
    size_t n_centers_;
};

// Density <= 0 (or non-finite) where a logarithm is required.
class DensityDomainError : public AnalysisError {
public:
    DensityDomainError(double coordinate, double density);

    double coordinate() const noexcept { return coordinate_; }
    double density() const noexcept { return density_; }

private:
    double coordinate_;
    double density_;
};

// The density estimator cannot be fitted to the sample set.
class EstimatorError : public AnalysisError {
public:
    explicit EstimatorError(const std::string& what) : AnalysisError(what) {}
};

// Malformed record in a trajectory file.
class TrajectoryFormatError : public std::runtime_error {
public:
    TrajectoryFormatError(const std::string& path, size_t line, const std::string& detail);

    const std::string& path() const noexcept { return path_; }
    size_t line() const noexcept { return line_; }

private:
    std::string path_;
    size_t line_;
};

// Fail fast before any analysis: throws EmptyTrajectoryError or
// MismatchedLengthError.
void validate_columns(const TrajectoryColumns& columns);

}  // namespace evbkit
