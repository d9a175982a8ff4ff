#pragma once
#include <boost/program_options.hpp>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace devicehost::cli {

namespace po = boost::program_options;

/**
 * One node of the devicehost command tree. Each command declares its own
 * options and reads them back typed from the parsed variables_map. A leading
 * word naming a subcommand hands the remaining words to that subcommand.
 */
class Command {
public:
    Command(std::string name, std::string summary);
    virtual ~Command() = default;

    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    const std::string& name() const { return name_; }
    const std::string& summary() const { return summary_; }

    // "devicehost serve" for a subcommand of the root
    std::string path() const;

    /// @throws std::invalid_argument if a subcommand of that name exists
    void add_command(std::shared_ptr<Command> command);
    std::shared_ptr<Command> find_command(const std::string& name) const;

    // argv[0] is the program name. Returns the process exit code: parse
    // errors and exceptions thrown by run() give 1.
    int execute(int argc, char* argv[]);
    int execute(const std::vector<std::string>& args);

    void print_help(std::ostream& os) const;

protected:
    virtual int run(const po::variables_map& vm) = 0;

    po::options_description& options() { return options_; }
    void set_examples(std::string examples) { examples_ = std::move(examples); }

private:
    int dispatch(const std::vector<std::string>& args);

    std::string name_;
    std::string summary_;
    std::string examples_;
    po::options_description options_;
    std::vector<std::shared_ptr<Command>> subcommands_;
    const Command* parent_ = nullptr;
};

}  // namespace devicehost::cli
