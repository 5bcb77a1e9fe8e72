// evbkit speciation: carbonic acid species fractions versus pH

#include "subcommand.hpp"
#include "evbkit/speciation.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

namespace evbkit {
namespace cli {

int cmd_speciation(int argc, char* argv[]) {
    AcidConstants k;
    std::string output_file;

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--ka1") == 0 && i + 1 < argc) {
                k.ka1 = std::stod(argv[++i]);
            } else if (strcmp(argv[i], "--ka2") == 0 && i + 1 < argc) {
                k.ka2 = std::stod(argv[++i]);
            } else if (strcmp(argv[i], "--pka1") == 0 && i + 1 < argc) {
                k.pka1 = std::stod(argv[++i]);
            } else if (strcmp(argv[i], "--pka2") == 0 && i + 1 < argc) {
                k.pka2 = std::stod(argv[++i]);
            } else if ((strcmp(argv[i], "--output") == 0 || strcmp(argv[i], "-o") == 0) && i + 1 < argc) {
                output_file = argv[++i];
            } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
                std::cerr << "Usage: evbkit speciation [options]\n\n";
                std::cerr << "Fractions of H2CO3, HCO3- and CO3^2- versus pH (Henderson-Hasselbalch).\n\n";
                std::cerr << "Options:\n";
                std::cerr << "  --ka1 <float>          First dissociation constant (default: 3.54e-4)\n";
                std::cerr << "  --ka2 <float>          Second dissociation constant (default: 4.69e-11)\n";
                std::cerr << "  --pka1 <float>         pKa1 marked in the table (default: 3.45)\n";
                std::cerr << "  --pka2 <float>         pKa2 marked in the table (default: 10.329)\n";
                std::cerr << "  --output, -o <file>    Write the full curve (pH 0-14, step 0.1) as TSV\n";
                std::cerr << "  --help, -h             Show this help\n";
                return 0;
            } else {
                std::cerr << "Error: Unknown option: " << argv[i] << "\n";
                std::cerr << "Use --help for usage.\n";
                return 1;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid numeric value\n";
        return 1;
    }

    if (!(k.ka1 > 0.0) || !(k.ka2 > 0.0)) {
        std::cerr << "Error: --ka1 and --ka2 must be positive\n";
        return 1;
    }

    print_speciation_table(std::cout, report_points(k));

    if (!output_file.empty()) {
        std::ofstream out(output_file);
        if (!out) {
            std::cerr << "Error: Cannot open output file: " << output_file << "\n";
            return 1;
        }
        write_speciation_tsv(out, speciation_curve(k));
    }

    return 0;
}

namespace {
    struct SpeciationRegistrar {
        SpeciationRegistrar() {
            SubcommandRegistry::instance().register_command(
                "speciation",
                "Carbonic acid speciation table (Henderson-Hasselbalch)",
                cmd_speciation, 90);
        }
    };
    static SpeciationRegistrar registrar;
}

}  // namespace cli
}  // namespace evbkit
