#include <iostream>
#include <string>
#include <vector>
#include "postrelay/core/application.hpp"
#include "postrelay/core/cli.hpp"
#include "postrelay/core/command_registry.hpp"
#include "postrelay/core/config.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"
#include "postrelay/crypto/random.hpp"

int main(int argc, char* argv[]) {
    using namespace postrelay;

    core::CommandLineParser parser("postrelay");
    parser.add_command("timeline", "Print the current posts");
    parser.add_command("post", "Publish a post: post <text...>");
    parser.add_command("status", "Show the delivery strategy and durable queue");
    parser.add_command("recover", "Deliver outstanding durable jobs");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = core::Config::instance();
    config.set_defaults();

    std::string config_file = core::utils::FileUtils::expand_home(
        parser.get_option("config", "~/.postrelay.conf")).string();
    if (core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file);
    }
    config.apply_environment_overrides();
    if (parser.has_option("server")) {
        config.set("server.base_url", parser.get_option("server"));
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Config error: " << problem << "\n";
        }
        return 1;
    }

    auto log_level = parser.has_option("verbose")
        ? core::LogLevel::Debug
        : core::Logger::parse_level(config.get_string("log.level", "info"));
    core::Logger::initialize(config.get_string("log.file", "postrelay.log"), log_level);

    LOG_INFO("postrelay starting up");

    if (!crypto::SecureRandom::initialize()) {
        LOG_CRITICAL("Failed to initialize the random number generator");
        return 1;
    }

    core::Application app(config);
    try {
        app.start();
    } catch (const std::exception& e) {
        LOG_CRITICAL("Startup failed: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        core::Logger::shutdown();
        return 1;
    }

    // Recovery is the first queue activity of a durable run.
    if (app.delivery().profile().level_tag == "level4") {
        app.recover_queue();
    }

    core::CommandContext context{app.delivery(), &app.queue(), std::cin, std::cout};
    if (parser.has_option("strategy")) {
        context.strategy = parser.get_option("strategy");
    }
    if (parser.has_option("video")) {
        context.video = parser.get_option("video");
    }
    context.recover_queue = [&app]() { return app.recover_queue(); };
    context.wait_for_queue = [&app]() { return app.wait_for_queue(); };

    core::CommandRegistry command_registry(context);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        app.shutdown();
        core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    app.shutdown();
    core::Logger::shutdown();
    return result.exit_code;
}
