// tests/cli/test_command.cpp
#define BOOST_TEST_MODULE CommandTests
#include <boost/test/unit_test.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "devicehost/cli/command.hpp"
#include "devicehost/cli/root_command.hpp"

using namespace devicehost::cli;

namespace {

// Declares serve's options and records what it parsed
class RecordingCommand : public Command {
public:
    RecordingCommand() : Command("serve", "test command") {
        options().add_options()(
            "config,c",
            po::value<std::string>()->default_value("config/devicehost.yaml"),
            "Configuration file path")(
            "singleton", po::bool_switch(), "Singleton mode")(
            "address", po::value<std::string>(), "Device address");
    }

    int runs = 0;
    int exit_code = 0;
    std::string config;
    bool config_defaulted = false;
    bool singleton = false;
    std::optional<std::string> address;

protected:
    int run(const po::variables_map& vm) override {
        ++runs;
        config = vm["config"].as<std::string>();
        config_defaulted = vm["config"].defaulted();
        singleton = vm["singleton"].as<bool>();
        if (vm.count("address")) {
            address = vm["address"].as<std::string>();
        }
        return exit_code;
    }
};

class TestRoot : public Command {
public:
    TestRoot() : Command("devicehost", "test root") {}

protected:
    int run(const po::variables_map&) override { return 7; }
};

class ThrowingCommand : public Command {
public:
    ThrowingCommand() : Command("boom", "always fails") {}

protected:
    int run(const po::variables_map&) override {
        throw std::runtime_error("device unreachable");
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(CommandTestSuite)

BOOST_AUTO_TEST_CASE(test_subcommand_options_are_typed) {
    TestRoot root;
    auto serve = std::make_shared<RecordingCommand>();
    root.add_command(serve);

    int code = root.execute({"serve", "--singleton", "--address", "10.0.0.5"});

    BOOST_CHECK_EQUAL(code, 0);
    BOOST_CHECK_EQUAL(serve->runs, 1);
    BOOST_CHECK(serve->singleton);
    BOOST_REQUIRE(serve->address.has_value());
    BOOST_CHECK_EQUAL(*serve->address, "10.0.0.5");
    BOOST_CHECK(serve->config_defaulted);
    BOOST_CHECK_EQUAL(serve->config, "config/devicehost.yaml");
    BOOST_CHECK_EQUAL(serve->path(), "devicehost serve");
}

BOOST_AUTO_TEST_CASE(test_argv_skips_program_name) {
    TestRoot root;
    auto serve = std::make_shared<RecordingCommand>();
    root.add_command(serve);

    std::vector<std::string> words{"/usr/bin/devicehost", "serve", "-c",
                                   "custom.yaml"};
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(word.data());
    }

    BOOST_CHECK_EQUAL(root.execute(static_cast<int>(argv.size()), argv.data()),
                      0);
    BOOST_CHECK(!serve->config_defaulted);
    BOOST_CHECK_EQUAL(serve->config, "custom.yaml");
    BOOST_CHECK(!serve->singleton);
    BOOST_CHECK(!serve->address.has_value());
}

BOOST_AUTO_TEST_CASE(test_exit_code_propagates) {
    TestRoot root;
    auto serve = std::make_shared<RecordingCommand>();
    serve->exit_code = 3;
    root.add_command(serve);

    BOOST_CHECK_EQUAL(root.execute({"serve"}), 3);
    BOOST_CHECK_EQUAL(root.execute(std::vector<std::string>{}), 7);
}

BOOST_AUTO_TEST_CASE(test_bad_arguments_fail) {
    TestRoot root;
    auto serve = std::make_shared<RecordingCommand>();
    root.add_command(serve);

    BOOST_CHECK_EQUAL(root.execute({"serve", "--verbose"}), 1);
    BOOST_CHECK_EQUAL(root.execute({"serve", "--address"}), 1);
    BOOST_CHECK_EQUAL(root.execute({"serve", "extra"}), 1);
    BOOST_CHECK_EQUAL(root.execute({"bogus"}), 1);
    BOOST_CHECK_EQUAL(serve->runs, 0);
}

BOOST_AUTO_TEST_CASE(test_help_skips_run) {
    TestRoot root;
    auto serve = std::make_shared<RecordingCommand>();
    root.add_command(serve);

    BOOST_CHECK_EQUAL(root.execute({"serve", "--help"}), 0);
    BOOST_CHECK_EQUAL(root.execute({"-h"}), 0);
    BOOST_CHECK_EQUAL(serve->runs, 0);
}

BOOST_AUTO_TEST_CASE(test_run_exception_gives_failure_code) {
    TestRoot root;
    root.add_command(std::make_shared<ThrowingCommand>());
    BOOST_CHECK_EQUAL(root.execute({"boom"}), 1);
}

BOOST_AUTO_TEST_CASE(test_duplicate_command_rejected) {
    TestRoot root;
    root.add_command(std::make_shared<RecordingCommand>());
    BOOST_CHECK_THROW(root.add_command(std::make_shared<RecordingCommand>()),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_root_registers_commands) {
    RootCommand root;
    BOOST_CHECK(root.find_command("serve") != nullptr);
    BOOST_CHECK(root.find_command("components") != nullptr);
    BOOST_CHECK(root.find_command("server") == nullptr);
}

BOOST_AUTO_TEST_CASE(test_root_version_flag) {
    RootCommand root;
    BOOST_CHECK_EQUAL(root.execute({"--version"}), 0);
    BOOST_CHECK_EQUAL(root.execute({"-v"}), 0);
    BOOST_CHECK_EQUAL(root.execute({"bogus"}), 1);
}

BOOST_AUTO_TEST_SUITE_END()
