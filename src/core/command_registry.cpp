#include "postrelay/core/command_registry.hpp"
#include <iomanip>

namespace postrelay::core {

CommandRegistry::CommandRegistry(CommandContext& context) {
    register_command("timeline", std::make_unique<TimelineCommandHandler>(context));
    register_command("post", std::make_unique<PostCommandHandler>(context));
    register_command("status", std::make_unique<StatusCommandHandler>(context));
    register_command("recover", std::make_unique<RecoverCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";

    for (const auto& [name, handler] : handlers_) {
        out << "  " << std::left << std::setw(15) << name
                  << handler->get_description() << "\n";
        out << "  " << std::left << std::setw(15) << " "
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}
