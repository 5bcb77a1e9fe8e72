// evbkit civec: CI amplitude densities and free energy profiles
//
// Fits a Gaussian KDE to the squared largest (and second largest) CI
// coefficient per frame and either reports the densities or converts
// them to a free energy profile.

#include "subcommand.hpp"
#include "args.hpp"
#include "evbkit/amplitude.hpp"
#include "evbkit/errors.hpp"
#include "evbkit/evb_reader.hpp"
#include "evbkit/free_energy.hpp"
#include "evbkit/gaussian_kde.hpp"
#include "evbkit/log_utils.hpp"
#include "evbkit/report.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace evbkit {
namespace cli {

namespace {

template <typename WriteFn>
bool write_to(const std::string& path, WriteFn fn) {
    if (path.empty()) {
        fn(std::cout);
        return true;
    }
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Error: Cannot open output file: " << path << "\n";
        return false;
    }
    fn(out);
    return true;
}

}  // namespace

int cmd_civec(int argc, char* argv[]) {
    CivecOptions opts;
    try {
        opts = parse_civec_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Use --help for usage.\n";
        }
        return e.exit_code();
    }

    const auto t_start = std::chrono::steady_clock::now();

    try {
        if (opts.verbose) {
            std::cerr << "CI vector analysis: " << opts.input_file << "\n";
            std::cerr << "  Mode: " << profile_mode_to_string(opts.mode) << "\n";
            std::cerr << "  Bins: " << opts.nbins << "\n";
        }

        log_utils::StageTimer load(opts.verbose, "Reading trajectory");
        const TrajectoryColumns cols = load_trajectory(opts.input_file, opts.complex_id);
        load.done(std::to_string(cols.num_frames()) + " frames");

        const AmplitudeSamples samples = extract_amplitudes(cols.amplitude_vectors);

        if (!opts.amplitudes_file.empty()) {
            if (!write_to(opts.amplitudes_file, [&](std::ostream& os) {
                    write_amplitudes_tsv(os, cols.timesteps, samples);
                })) {
                return 1;
            }
        }

        FreeEnergyProfiler profiler(std::make_shared<GaussianKdeEstimator>());

        RunSummary summary;
        summary.command = "civec";
        summary.n_frames = cols.num_frames();
        summary.samples = &samples;
        summary.mode = profile_mode_to_string(opts.mode);
        summary.nbins = opts.nbins;

        EnergyProfile profile;
        log_utils::StageTimer fit(opts.verbose, "Fitting densities");
        if (opts.mode == ProfileMode::DENSITY) {
            const DensityProfile dens = profiler.density_profile(samples, opts.nbins);
            fit.done(std::to_string(dens.size()) + " grid points");
            if (!write_to(opts.output_file, [&](std::ostream& os) {
                    write_density_profile_tsv(os, dens);
                })) {
                return 1;
            }
        } else {
            profile = profiler.energy_profile(opts.mode, samples, opts.nbins);
            fit.done(std::to_string(profile.size()) + " grid points");
            summary.profile = &profile;
            if (!write_to(opts.output_file, [&](std::ostream& os) {
                    write_energy_profile_tsv(os, profile);
                })) {
                return 1;
            }
        }

        if (!opts.summary_file.empty()) {
            if (!write_to(opts.summary_file, [&](std::ostream& os) {
                    write_summary_json(os, summary);
                })) {
                return 1;
            }
        }

        if (opts.verbose) {
            std::cerr << "Total time: "
                      << log_utils::format_elapsed(t_start, std::chrono::steady_clock::now())
                      << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
    struct CivecRegistrar {
        CivecRegistrar() {
            SubcommandRegistry::instance().register_command(
                "civec",
                "CI amplitude density or free energy profile",
                cmd_civec, 20);
        }
    };
    static CivecRegistrar registrar;
}

}  // namespace cli
}  // namespace evbkit
