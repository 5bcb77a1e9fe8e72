/**
 * @file cmd_hop.cpp
 * @brief Proton hop function over an MS-EVB trajectory.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "evbkit/errors.hpp"
#include "evbkit/evb_reader.hpp"
#include "evbkit/hop_classifier.hpp"
#include "evbkit/log_utils.hpp"
#include "evbkit/report.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

namespace evbkit {
namespace cli {

int cmd_hop(int argc, char* argv[]) {
    HopOptions opts;
    try {
        opts = parse_hop_args(argc, argv);
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
            std::cerr << "Hop function: " << opts.input_file
                      << " (complex " << opts.complex_id << ")\n";
        }

        log_utils::StageTimer load(opts.verbose, "Reading trajectory");
        const TrajectoryColumns cols = load_trajectory(opts.input_file, opts.complex_id);
        load.done(std::to_string(cols.num_frames()) + " frames");

        log_utils::StageTimer classify(opts.verbose, "Classifying hops");
        const HopTrace trace = classify_hops(cols.centers);
        classify.done(std::to_string(trace.n_forward) + " forward, " +
                      std::to_string(trace.n_backward) + " backward");

        if (opts.output_file.empty()) {
            write_hop_tsv(std::cout, cols.timesteps, cols.centers, trace);
        } else {
            std::ofstream out(opts.output_file);
            if (!out) {
                std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
                return 1;
            }
            write_hop_tsv(out, cols.timesteps, cols.centers, trace);
        }

        if (!opts.summary_file.empty()) {
            std::ofstream sum(opts.summary_file);
            if (!sum) {
                std::cerr << "Error: Cannot open summary file: " << opts.summary_file << "\n";
                return 1;
            }
            RunSummary s;
            s.command = "hop";
            s.n_frames = cols.num_frames();
            s.trace = &trace;
            write_summary_json(sum, s);
        }

        if (opts.verbose) {
            std::cerr << "Net displacement: " << trace.net_displacement() << "\n";
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
    struct HopRegistrar {
        HopRegistrar() {
            SubcommandRegistry::instance().register_command(
                "hop",
                "Proton hop function h(t) from reaction centers",
                cmd_hop, 10);
        }
    };
    static HopRegistrar registrar;
}

}  // namespace cli
}  // namespace evbkit
