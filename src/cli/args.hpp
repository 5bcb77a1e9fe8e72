#ifndef EVBKIT_CLI_ARGS_HPP
#define EVBKIT_CLI_ARGS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

#include "evbkit/free_energy.hpp"

namespace evbkit {
namespace cli {

// Thrown by the parsers instead of calling exit(); the command returns
// exit_code() after printing message() (if any) to stderr.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& message = std::string())
        : std::runtime_error(message), exit_code_(code) {}

    int exit_code() const noexcept { return exit_code_; }

private:
    int exit_code_;
};

struct HopOptions {
    std::string input_file;
    std::string output_file;       // empty = stdout
    std::string summary_file;      // JSON summary
    int complex_id = 1;
    bool verbose = false;
};

struct CivecOptions {
    std::string input_file;
    std::string output_file;       // empty = stdout
    std::string amplitudes_file;   // per-frame c1^2 / c2^2 TSV
    std::string summary_file;      // JSON summary
    size_t nbins = 200;
    ProfileMode mode = ProfileMode::DENSITY;
    int complex_id = 1;
    bool verbose = false;
};

void print_hop_usage(const char* program_name);
void print_civec_usage(const char* program_name);

// argv[0] is the subcommand name.
// --help throws ParseArgsExit(0); errors throw ParseArgsExit(1, message).
HopOptions parse_hop_args(int argc, char* argv[]);
CivecOptions parse_civec_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace evbkit

#endif  // EVBKIT_CLI_ARGS_HPP
