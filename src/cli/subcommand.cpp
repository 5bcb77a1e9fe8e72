#include "subcommand.hpp"
#include "evbkit/version.h"
#include <algorithm>
#include <iostream>
#include <ostream>

namespace evbkit {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    handlers_[name] = fn;
    command_list_.push_back({name, description, order});
}

bool SubcommandRegistry::has_command(const std::string& name) const {
    return handlers_.find(name) != handlers_.end();
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'evbkit --help' for usage information.\n";
        return 1;
    }
    return it->second(argc, argv);
}

std::vector<SubcommandRegistry::CommandEntry> SubcommandRegistry::commands() const {
    auto sorted = command_list_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const CommandEntry& a, const CommandEntry& b) {
                         return a.order < b.order;
                     });
    return sorted;
}

void SubcommandRegistry::print_help(std::ostream& out, const char* program_name) const {
    out << "evbkit " << EVBKIT_VERSION << " - MS-EVB trajectory analysis\n\n";
    out << "Usage: " << program_name << " <command> [options]\n";
    out << "       " << program_name << " help <command>\n\n";
    out << "Commands:\n";

    const auto sorted = commands();
    size_t max_len = 0;
    for (const auto& cmd : sorted) {
        max_len = std::max(max_len, cmd.name.length());
    }
    for (const auto& cmd : sorted) {
        out << "  " << cmd.name << std::string(max_len + 2 - cmd.name.length(), ' ')
            << cmd.description << "\n";
    }

    out << "\nTrajectories are RAPTOR evb.out files, plain or gzip (.gz).\n";
    out << "\nEnvironment:\n";
    out << "  EVBKIT_NO_PIGZ=1         Decompress .gz input with zlib instead of pigz\n";
    out << "  EVBKIT_PIGZ_THREADS=<n>  pigz threads (default: 4)\n";
}

void SubcommandRegistry::print_help(const char* program_name) const {
    print_help(std::cout, program_name);
}

}  // namespace cli
}  // namespace evbkit
