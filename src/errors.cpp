#include "evbkit/errors.hpp"

#include <sstream>

namespace evbkit {

namespace {

std::string insufficient_states_message(size_t frame, size_t n_states) {
    std::ostringstream oss;
    oss << "Frame " << frame << " has " << n_states
        << " state amplitude(s); at least 2 are required";
    return oss.str();
}

std::string mismatched_length_message(size_t n_ts, size_t n_ci, size_t n_rc) {
    std::ostringstream oss;
    oss << "Trajectory columns differ in length (timesteps=" << n_ts
        << ", ci_vectors=" << n_ci << ", rxn_centers=" << n_rc << ")";
    return oss.str();
}

std::string density_domain_message(double coordinate, double density) {
    std::ostringstream oss;
    oss << "Density is not positive at coordinate " << coordinate
        << " (pdf=" << density << "); free energy is undefined there";
    return oss.str();
}

std::string format_error_message(const std::string& path, size_t line,
                                 const std::string& detail) {
    std::ostringstream oss;
    oss << path << ":" << line << ": " << detail;
    return oss.str();
}

}  // namespace

InsufficientStatesError::InsufficientStatesError(size_t frame, size_t n_states)
    : AnalysisError(insufficient_states_message(frame, n_states))
    , frame_(frame)
    , n_states_(n_states) {}

MismatchedLengthError::MismatchedLengthError(size_t n_timesteps,
                                             size_t n_amplitude_vectors,
                                             size_t n_centers)
    : AnalysisError(mismatched_length_message(n_timesteps, n_amplitude_vectors, n_centers))
    , n_timesteps_(n_timesteps)
    , n_amplitude_vectors_(n_amplitude_vectors)
    , n_centers_(n_centers) {}

DensityDomainError::DensityDomainError(double coordinate, double density)
    : AnalysisError(density_domain_message(coordinate, density))
    , coordinate_(coordinate)
    , density_(density) {}

TrajectoryFormatError::TrajectoryFormatError(const std::string& path, size_t line,
                                             const std::string& detail)
    : std::runtime_error(format_error_message(path, line, detail))
    , path_(path)
    , line_(line) {}

void validate_columns(const TrajectoryColumns& columns) {
    const size_t n_ts = columns.timesteps.size();
    const size_t n_ci = columns.amplitude_vectors.size();
    const size_t n_rc = columns.centers.size();

    if (n_ts == 0 && n_ci == 0 && n_rc == 0) {
        throw EmptyTrajectoryError();
    }
    if (n_ts != n_ci || n_ts != n_rc) {
        throw MismatchedLengthError(n_ts, n_ci, n_rc);
    }
}

}  // namespace evbkit
