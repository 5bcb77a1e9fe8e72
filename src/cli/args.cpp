#include "args.hpp"
#include "evbkit/version.h"
#include <iostream>
#include <string>

namespace evbkit {
namespace cli {

void print_hop_usage(const char* program_name) {
    std::cout << "Usage: evbkit " << program_name << " <evb.out> [options]\n\n";
    std::cout << "Evaluate the proton hop function h(t) from the reaction center sequence.\n";
    std::cout << "h(0) = 0; +1 for a hop to a new acceptor, -1 for a hop back to the last donor.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output <file>      Output TSV (default: stdout)\n";
    std::cout << "  --complex <int>          EVB complex to analyze (default: 1)\n";
    std::cout << "  --summary <file>         Write JSON run summary\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version\n";
    std::cout << "  -h, --help               Show this help message\n";
}

void print_civec_usage(const char* program_name) {
    std::cout << "Usage: evbkit " << program_name << " <evb.out> [options]\n\n";
    std::cout << "Probability density of the squared CI coefficients, or the free energy\n";
    std::cout << "profile derived from it (kcal/mol, T = 300 K).\n\n";
    std::cout << "Options:\n";
    std::cout << "  -b, --bins <int>         Number of grid points (default: 200)\n";
    std::cout << "  -f, --freeenergy         Free energy profile of the largest amplitude c1^2\n";
    std::cout << "  -fd, --freeenergydiff    Free energy profile of c1^2 - c2^2\n";
    std::cout << "  -o, --output <file>      Output TSV (default: stdout)\n";
    std::cout << "  --amplitudes <file>      Write per-frame c1^2 / c2^2 TSV\n";
    std::cout << "  --complex <int>          EVB complex to analyze (default: 1)\n";
    std::cout << "  --summary <file>         Write JSON run summary\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  evbkit " << program_name << " evb.out -o pdf.tsv\n";
    std::cout << "  evbkit " << program_name << " evb.out.gz -fd -b 100 -o dG_diff.tsv\n";
}

namespace {

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw ParseArgsExit(1, "Error: Missing value for " + flag);
    }
    return argv[++i];
}

size_t parse_size(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        if (!value.empty() && value[0] == '-') {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        size_t parsed = std::stoull(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

void set_positional(std::string& slot, const std::string& arg) {
    if (!arg.empty() && arg[0] == '-') {
        throw ParseArgsExit(1, "Error: Unknown option: " + arg);
    }
    // Only the first trajectory file is analyzed
    if (slot.empty()) slot = arg;
}

}  // namespace

HopOptions parse_hop_args(int argc, char* argv[]) {
    HopOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_hop_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            std::cout << "evbkit " << argv[0] << " " << EVBKIT_VERSION << "\n";
            throw ParseArgsExit(0);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(argc, argv, i, arg);
        } else if (arg == "--summary") {
            opts.summary_file = require_value(argc, argv, i, arg);
        } else if (arg == "--complex") {
            opts.complex_id = parse_int(arg, require_value(argc, argv, i, arg));
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            set_positional(opts.input_file, arg);
        }
    }

    if (opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: No input file specified");
    }
    return opts;
}

CivecOptions parse_civec_args(int argc, char* argv[]) {
    CivecOptions opts;
    bool want_fe = false;
    bool want_fe_diff = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_civec_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            std::cout << "evbkit " << argv[0] << " " << EVBKIT_VERSION << "\n";
            throw ParseArgsExit(0);
        } else if (arg == "-b" || arg == "--bins") {
            opts.nbins = parse_size(arg, require_value(argc, argv, i, arg));
            if (opts.nbins < 1) {
                throw ParseArgsExit(1, "Error: --bins must be >= 1");
            }
        } else if (arg == "-f" || arg == "--freeenergy") {
            want_fe = true;
        } else if (arg == "-fd" || arg == "--freeenergydiff") {
            want_fe_diff = true;
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(argc, argv, i, arg);
        } else if (arg == "--amplitudes") {
            opts.amplitudes_file = require_value(argc, argv, i, arg);
        } else if (arg == "--summary") {
            opts.summary_file = require_value(argc, argv, i, arg);
        } else if (arg == "--complex") {
            opts.complex_id = parse_int(arg, require_value(argc, argv, i, arg));
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            set_positional(opts.input_file, arg);
        }
    }

    if (want_fe && want_fe_diff) {
        throw ParseArgsExit(1, "Error: --freeenergy and --freeenergydiff are mutually exclusive");
    }
    if (want_fe) opts.mode = ProfileMode::SINGLE_ENERGY;
    if (want_fe_diff) opts.mode = ProfileMode::DIFFERENCE_ENERGY;

    if (opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: No input file specified");
    }
    return opts;
}

}  // namespace cli
}  // namespace evbkit
