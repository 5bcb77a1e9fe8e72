#pragma once
// TSV and JSON writers for analysis results.

#include <cstddef>
#include <iosfwd>
#include <vector>

#include "evbkit/types.hpp"

namespace evbkit {

// Timesteps are in fs; time_ps = timestep / 1000.
void write_hop_tsv(std::ostream& out,
                   const std::vector<Timestep>& timesteps,
                   const std::vector<CenterId>& centers,
                   const HopTrace& trace);

void write_energy_profile_tsv(std::ostream& out, const EnergyProfile& profile);

void write_density_profile_tsv(std::ostream& out, const DensityProfile& profile);

void write_amplitudes_tsv(std::ostream& out,
                          const std::vector<Timestep>& timesteps,
                          const AmplitudeSamples& samples);

// Run summary. `trace`, `samples` and `profile` may be null when the
// corresponding analysis was not run.
struct RunSummary {
    const char* command = "";
    size_t n_frames = 0;
    const HopTrace* trace = nullptr;
    const AmplitudeSamples* samples = nullptr;
    const EnergyProfile* profile = nullptr;
    const char* mode = nullptr;
    size_t nbins = 0;
};

void write_summary_json(std::ostream& out, const RunSummary& summary);

}  // namespace evbkit
