#ifndef EVBKIT_CLI_SUBCOMMAND_HPP
#define EVBKIT_CLI_SUBCOMMAND_HPP

#include <iosfwd>
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>

namespace evbkit {
namespace cli {

// Subcommand handler function type
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Registry of available subcommands
class SubcommandRegistry {
public:
    struct CommandEntry {
        std::string name;
        std::string description;
        int order;
    };

    static SubcommandRegistry& instance();

    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    bool has_command(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    // Registered commands in display order
    std::vector<CommandEntry> commands() const;

    void print_help(std::ostream& out, const char* program_name) const;
    void print_help(const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::unordered_map<std::string, SubcommandFn> handlers_;
    std::vector<CommandEntry> command_list_;
};

int cmd_hop(int argc, char* argv[]);
int cmd_civec(int argc, char* argv[]);
int cmd_speciation(int argc, char* argv[]);

}  // namespace cli
}  // namespace evbkit

#endif  // EVBKIT_CLI_SUBCOMMAND_HPP
