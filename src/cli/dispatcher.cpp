// evbkit command-line entry point
//
//   evbkit hop <evb.out>            Proton hop function over a trajectory
//   evbkit civec <evb.out>          CI amplitude density / free energy profile
//   evbkit speciation               Carbonic acid speciation table
//   evbkit help <command>           Same as 'evbkit <command> --help'

#include "subcommand.hpp"
#include "evbkit/version.h"
#include <cstring>
#include <iostream>

int main(int argc, char* argv[]) {
    auto& registry = evbkit::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(std::cerr, argv[0]);
        return 1;
    }

    const char* command = argv[1];

    if (strcmp(command, "--help") == 0 || strcmp(command, "-h") == 0) {
        registry.print_help(argv[0]);
        return 0;
    }

    if (strcmp(command, "--version") == 0 || strcmp(command, "-V") == 0) {
        std::cout << "evbkit " << EVBKIT_VERSION << "\n";
        return 0;
    }

    if (strcmp(command, "help") == 0) {
        if (argc < 3) {
            registry.print_help(argv[0]);
            return 0;
        }
        char help_flag[] = "--help";
        char* sub_argv[] = {argv[2], help_flag, nullptr};
        return registry.run_command(argv[2], 2, sub_argv);
    }

    return registry.run_command(command, argc - 1, argv + 1);
}
