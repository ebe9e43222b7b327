#include "postrelay/core/command_handler.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"
#include <iomanip>
#include <iostream>

namespace postrelay::core {

using delivery::DeliveryError;

namespace {

std::string join_args(const std::vector<std::string>& args, size_t first) {
    std::string joined;
    for (size_t i = first; i < args.size(); ++i) {
        if (!joined.empty()) joined += ' ';
        joined += args[i];
    }
    return joined;
}

}

CommandResult TimelineCommandHandler::execute(const std::vector<std::string>&) {
    auto items = context_.service.fetch_timeline();
    auto& out = context_.output;

    if (items.empty()) {
        out << "No posts yet.\n";
        return CommandResult::ok("Timeline is empty");
    }

    for (const auto& item : items) {
        out << "[" << item.level << "] " << utils::TimeUtils::to_iso_string(item.created_at)
            << "  " << item.id << "\n";
        out << "    " << item.text << "\n";
    }
    out << items.size() << " post(s)\n";
    return CommandResult::ok();
}

CommandResult PostCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    delivery::SubmitRequest request;
    request.text = join_args(args, 1);

    if (context_.strategy) {
        auto strategy = delivery::retry_strategy_from_string(*context_.strategy);
        if (!strategy) {
            return CommandResult::error("Unknown retry strategy: " + *context_.strategy);
        }
        request.strategy = *strategy;
    }
    if (context_.video) {
        request.video_path = utils::FileUtils::expand_home(*context_.video);
    }

    auto profile = context_.service.profile();
    auto& out = context_.output;
    out << "Posting via " << profile.title << " (" << profile.level_tag << ")\n";

    auto show_progress = [&out](double fraction) {
        out << "\rProgress: " << std::setw(3) << static_cast<int>(fraction * 100.0) << "%" << std::flush;
    };

    while (true) {
        auto result = context_.service.submit(request, show_progress);
        out << "\n";

        if (result) {
            break;
        }

        if (result.error == DeliveryError::MANUAL_RETRY_REQUESTED && result.retry_payload) {
            if (confirm_retry(result.message)) {
                request = *result.retry_payload;
                continue;
            }
            return CommandResult::error(result.message);
        }

        return CommandResult::error(result.message);
    }

    // Durable posts are only queued at this point; give the drain loop a chance to run.
    if (context_.service.status_summary() && context_.wait_for_queue) {
        context_.wait_for_queue();
    }
    if (auto summary = context_.service.status_summary()) {
        out << *summary << "\n";
    }

    out << "Posted.\n";
    return CommandResult::ok("Post delivered");
}

bool PostCommandHandler::confirm_retry(const std::string& prompt) {
    context_.output << prompt << " [y/N] " << std::flush;

    std::string answer;
    if (!std::getline(context_.input, answer)) {
        return false;
    }
    answer = utils::StringUtils::to_lower(utils::StringUtils::trim(answer));
    return answer == "y" || answer == "yes";
}

CommandResult StatusCommandHandler::execute(const std::vector<std::string>&) {
    auto profile = context_.service.profile();
    auto& out = context_.output;

    out << "Strategy: " << profile.title << " (" << profile.level_tag << ")\n";
    out << "  Video uploads: " << (profile.supports_video ? "yes" : "no") << "\n";
    out << "  Retry selector: " << (profile.shows_retry_selector ? "yes" : "no") << "\n";

    if (context_.queue) {
        out << context_.queue->status_summary() << "\n";
    } else if (auto summary = context_.service.status_summary()) {
        out << *summary << "\n";
    }
    return CommandResult::ok();
}

CommandResult RecoverCommandHandler::execute(const std::vector<std::string>&) {
    if (!context_.queue || !context_.recover_queue) {
        return CommandResult::error("Durable queue is not available");
    }

    auto recovered = context_.recover_queue();
    context_.output << "Recovered " << recovered << " interrupted job(s)\n";

    bool idle = context_.wait_for_queue ? context_.wait_for_queue() : true;
    context_.output << context_.queue->status_summary() << "\n";

    if (!idle) {
        return CommandResult::error("Durable queue did not drain in time; jobs remain queued");
    }
    LOG_INFO("Recovery pass finished");
    return CommandResult::ok();
}

}
