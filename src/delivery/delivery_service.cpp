#include "postrelay/delivery/delivery_service.hpp"
#include "postrelay/core/config.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"
#include <stdexcept>

namespace postrelay::delivery {

namespace {

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template<typename T>
T& require(T* dependency, const char* name) {
    if (!dependency) {
        throw std::invalid_argument(std::string("Delivery strategy requires ") + name);
    }
    return *dependency;
}

}

StrategyProfile DeliveryService::profile() const {
    return std::visit([](const auto& engine) { return engine.profile(); }, engine_);
}

std::vector<network::ContentItem> DeliveryService::fetch_timeline() {
    return std::visit([](auto& engine) { return engine.fetch_timeline(); }, engine_);
}

DeliveryResult DeliveryService::submit(const SubmitRequest& request, const ProgressCallback& progress) {
    auto result = std::visit([&](auto& engine) { return engine.submit(request, progress); }, engine_);
    if (!result) {
        LOG_DEBUG("Submission under {} ended with: {}", profile().level_tag, result.message);
    }
    return result;
}

std::optional<std::string> DeliveryService::status_summary() {
    return std::visit(overloaded{
        [](DurableUploader& engine) -> std::optional<std::string> { return engine.status_summary(); },
        [](auto&) -> std::optional<std::string> { return std::nullopt; },
    }, engine_);
}

std::unique_ptr<DeliveryService> make_delivery_service(const core::Config& config,
                                                       const DeliveryDependencies& deps) {
    auto name = core::utils::StringUtils::to_lower(config.get_string("delivery.strategy", "level2"));
    auto& client = require(deps.client, "an HTTP client");
    Sleeper sleeper = deps.sleeper ? deps.sleeper : default_sleeper();

    LOG_INFO("Using delivery strategy {}", name);

    if (name == "level1") {
        return std::make_unique<DeliveryService>(std::in_place_type<FireAndForgetUploader>, client);
    }
    if (name == "level2") {
        return std::make_unique<DeliveryService>(std::in_place_type<RetryDisciplineUploader>, client, sleeper);
    }
    if (name == "level3") {
        auto temp_dir = config.get_string("storage.temp_dir", core::utils::FileUtils::get_temp_dir().string());
        auto chunk_size = config.get_as<uint64_t>("resumable.chunk_size").value_or(transfer::ChunkSlicer::DEFAULT_CHUNK_SIZE);
        return std::make_unique<DeliveryService>(std::in_place_type<ResumableUploader>,
                                                 client,
                                                 require(deps.bridge, "a background transfer bridge"),
                                                 require(deps.offsets, "an offset store"),
                                                 transfer::ChunkSlicer(temp_dir, chunk_size),
                                                 sleeper);
    }
    if (name == "level4") {
        return std::make_unique<DeliveryService>(std::in_place_type<DurableUploader>,
                                                 client,
                                                 require(deps.engine, "a durable job engine"));
    }

    throw std::invalid_argument("Unknown delivery strategy: " + name);
}

}
