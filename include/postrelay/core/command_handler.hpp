#pragma once

#include "../delivery/delivery_service.hpp"
#include "../queue/upload_job_engine.hpp"
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace postrelay::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

// What a command may touch. The queue is present only when the process owns one.
struct CommandContext {
    delivery::DeliveryService& service;
    queue::UploadJobEngine* queue = nullptr;
    std::istream& input;
    std::ostream& output;
    std::optional<std::string> strategy;
    std::optional<std::string> video;

    // Guarded recovery of interrupted jobs, and a bounded wait for the drain loop.
    std::function<size_t()> recover_queue;
    std::function<bool()> wait_for_queue;
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class TimelineCommandHandler : public CommandHandler {
public:
    explicit TimelineCommandHandler(CommandContext& context) : context_(context) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print the current posts"; }
    std::string get_usage() const override { return "postrelay timeline"; }

private:
    CommandContext& context_;
};

class PostCommandHandler : public CommandHandler {
public:
    explicit PostCommandHandler(CommandContext& context) : context_(context) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Publish a post under the configured strategy"; }
    std::string get_usage() const override {
        return "postrelay post <text> [--strategy backoff|capped|manual|idempotent] [--video <path>]";
    }

private:
    CommandContext& context_;

    bool confirm_retry(const std::string& prompt);
};

class StatusCommandHandler : public CommandHandler {
public:
    explicit StatusCommandHandler(CommandContext& context) : context_(context) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show delivery strategy and durable queue status"; }
    std::string get_usage() const override { return "postrelay status"; }

private:
    CommandContext& context_;
};

class RecoverCommandHandler : public CommandHandler {
public:
    explicit RecoverCommandHandler(CommandContext& context) : context_(context) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Deliver outstanding durable jobs once"; }
    std::string get_usage() const override { return "postrelay recover"; }

private:
    CommandContext& context_;
};

}
