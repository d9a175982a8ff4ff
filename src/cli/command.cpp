#include "devicehost/cli/command.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace devicehost::cli {

namespace {

// Words left over after the declared options
const char* const EXTRA_ARGS = "extra-args";

}  // namespace

Command::Command(std::string name, std::string summary)
    : name_(std::move(name)), summary_(std::move(summary)), options_("Options") {
    options_.add_options()("help,h", "Show this help");
}

std::string Command::path() const {
    return parent_ ? parent_->path() + " " + name_ : name_;
}

void Command::add_command(std::shared_ptr<Command> command) {
    if (find_command(command->name())) {
        throw std::invalid_argument("Command '" + command->name() +
                                    "' is already registered");
    }
    command->parent_ = this;
    subcommands_.push_back(std::move(command));
}

std::shared_ptr<Command> Command::find_command(const std::string& name) const {
    auto it = std::find_if(subcommands_.begin(), subcommands_.end(),
                           [&name](const std::shared_ptr<Command>& command) {
                               return command->name() == name;
                           });
    return it != subcommands_.end() ? *it : nullptr;
}

int Command::execute(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return execute(args);
}

int Command::execute(const std::vector<std::string>& args) {
    try {
        return dispatch(args);
    } catch (const po::error& e) {
        std::cerr << path() << ": " << e.what() << std::endl;
        std::cerr << "Run '" << path() << " --help' for usage." << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int Command::dispatch(const std::vector<std::string>& args) {
    if (!args.empty()) {
        if (auto subcommand = find_command(args.front())) {
            return subcommand->execute(
                std::vector<std::string>(args.begin() + 1, args.end()));
        }
    }

    po::options_description hidden;
    hidden.add_options()(EXTRA_ARGS, po::value<std::vector<std::string>>());
    po::options_description all;
    all.add(options_).add(hidden);
    po::positional_options_description positional;
    positional.add(EXTRA_ARGS, -1);

    po::variables_map vm;
    po::store(po::command_line_parser(args)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);

    if (vm.count("help")) {
        print_help(std::cout);
        return 0;
    }

    if (vm.count(EXTRA_ARGS)) {
        const auto& extra = vm[EXTRA_ARGS].as<std::vector<std::string>>();
        std::cerr << (subcommands_.empty() ? "Unexpected argument: "
                                           : "Unknown command: ")
                  << extra.front() << std::endl;
        std::cerr << "Run '" << path() << " --help' for usage." << std::endl;
        return 1;
    }

    po::notify(vm);
    return run(vm);
}

void Command::print_help(std::ostream& os) const {
    os << path() << " - " << summary_ << "\n\n";
    os << "Usage: " << path() << " [OPTIONS]"
       << (subcommands_.empty() ? "" : " <COMMAND> [COMMAND_OPTIONS]")
       << "\n\n";

    if (!subcommands_.empty()) {
        os << "Commands:\n";
        for (const auto& command : subcommands_) {
            os << "  " << std::left << std::setw(12) << command->name()
               << command->summary() << "\n";
        }
        os << "\n";
    }

    os << options_ << "\n";

    if (!examples_.empty()) {
        os << "Examples:\n" << examples_ << "\n";
    }
}

}  // namespace devicehost::cli
