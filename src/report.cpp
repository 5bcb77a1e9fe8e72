#include "evbkit/report.hpp"
#include "evbkit/version.h"

#include <algorithm>
#include <iomanip>
#include <ostream>

namespace evbkit {

void write_hop_tsv(std::ostream& out,
                   const std::vector<Timestep>& timesteps,
                   const std::vector<CenterId>& centers,
                   const HopTrace& trace) {
    out << "timestep\ttime_ps\tcenter\tevent\thop\n";
    const size_t n = std::min({timesteps.size(), centers.size(), trace.counts.size()});
    for (size_t i = 0; i < n; ++i) {
        out << timesteps[i]
            << '\t' << std::fixed << std::setprecision(3)
            << static_cast<double>(timesteps[i]) / 1000.0
            << '\t' << centers[i]
            << '\t' << hop_event_to_string(trace.events[i])
            << '\t' << trace.counts[i] << '\n';
    }
}

void write_energy_profile_tsv(std::ostream& out, const EnergyProfile& profile) {
    out << "coordinate\tfree_energy_kcal_mol\n";
    out << std::fixed;
    for (const auto& p : profile) {
        out << std::setprecision(6) << p.coordinate
            << '\t' << std::setprecision(6) << p.energy << '\n';
    }
}

void write_density_profile_tsv(std::ostream& out, const DensityProfile& profile) {
    out << "coordinate\tpdf_dominant\tpdf_secondary\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& p : profile) {
        out << p.coordinate << '\t' << p.dominant << '\t' << p.secondary << '\n';
    }
}

void write_amplitudes_tsv(std::ostream& out,
                          const std::vector<Timestep>& timesteps,
                          const AmplitudeSamples& samples) {
    out << "timestep\tc1_sq\tc2_sq\tdiff\n";
    out << std::fixed << std::setprecision(6);
    const size_t n = std::min(timesteps.size(), samples.size());
    for (size_t i = 0; i < n; ++i) {
        out << timesteps[i]
            << '\t' << samples.dominant_sq[i]
            << '\t' << samples.secondary_sq[i]
            << '\t' << (samples.dominant_sq[i] - samples.secondary_sq[i]) << '\n';
    }
}

void write_summary_json(std::ostream& out, const RunSummary& s) {
    out << std::fixed;
    out << "{\n";
    out << "  \"version\": \"" << EVBKIT_VERSION << "\",\n";
    out << "  \"command\": \"" << s.command << "\",\n";
    out << "  \"frames\": " << s.n_frames;

    if (s.trace) {
        out << ",\n  \"hops\": {\n";
        out << "    \"forward\": " << s.trace->n_forward << ",\n";
        out << "    \"backward\": " << s.trace->n_backward << ",\n";
        out << "    \"net_displacement\": " << s.trace->net_displacement() << "\n";
        out << "  }";
    }

    if (s.samples && s.samples->size() > 0) {
        double sum1 = 0.0, sum2 = 0.0;
        for (size_t i = 0; i < s.samples->size(); ++i) {
            sum1 += s.samples->dominant_sq[i];
            sum2 += s.samples->secondary_sq[i];
        }
        const double n = static_cast<double>(s.samples->size());
        out << ",\n  \"amplitudes\": {\n";
        out << "    \"mean_c1_sq\": " << std::setprecision(6) << (sum1 / n) << ",\n";
        out << "    \"mean_c2_sq\": " << std::setprecision(6) << (sum2 / n) << "\n";
        out << "  }";
    }

    if (s.mode) {
        out << ",\n  \"profile\": {\n";
        out << "    \"mode\": \"" << s.mode << "\",\n";
        out << "    \"nbins\": " << s.nbins;
        if (s.profile && !s.profile->empty()) {
            auto it = std::min_element(s.profile->begin(), s.profile->end(),
                                       [](const ProfilePoint& a, const ProfilePoint& b) {
                                           return a.energy < b.energy;
                                       });
            auto top = std::max_element(s.profile->begin(), s.profile->end(),
                                        [](const ProfilePoint& a, const ProfilePoint& b) {
                                            return a.energy < b.energy;
                                        });
            out << ",\n    \"points\": " << s.profile->size() << ",\n";
            out << "    \"min_coordinate\": " << std::setprecision(6) << it->coordinate << ",\n";
            out << "    \"max_energy\": " << std::setprecision(6) << top->energy << "\n";
        } else {
            out << "\n";
        }
        out << "  }";
    }

    out << "\n}\n";
}

}  // namespace evbkit
