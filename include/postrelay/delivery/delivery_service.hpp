#pragma once

#include "delivery_types.hpp"
#include "durable_uploader.hpp"
#include "fire_and_forget_uploader.hpp"
#include "resumable_uploader.hpp"
#include "retry_discipline_uploader.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace postrelay::core {
class Config;
}

namespace postrelay::delivery {

using DeliveryEngine = std::variant<FireAndForgetUploader,
                                    RetryDisciplineUploader,
                                    ResumableUploader,
                                    DurableUploader>;

// Uniform front for the four delivery strategies.
class DeliveryService {
public:
    template<typename Engine, typename... Args>
    explicit DeliveryService(std::in_place_type_t<Engine> tag, Args&&... args)
        : engine_(tag, std::forward<Args>(args)...) {}

    DeliveryService(const DeliveryService&) = delete;
    DeliveryService& operator=(const DeliveryService&) = delete;

    StrategyProfile profile() const;
    std::vector<network::ContentItem> fetch_timeline();
    DeliveryResult submit(const SubmitRequest& request, const ProgressCallback& progress = nullptr);

    // Only the durable strategy has something to report.
    std::optional<std::string> status_summary();

    const DeliveryEngine& engine() const { return engine_; }
    DeliveryEngine& engine() { return engine_; }

private:
    DeliveryEngine engine_;
};

// Collaborators a strategy may need. Only those used by the selected strategy must be set.
struct DeliveryDependencies {
    network::HttpClient* client = nullptr;
    transfer::BackgroundTransferBridge* bridge = nullptr;
    storage::OffsetStore* offsets = nullptr;
    queue::UploadJobEngine* engine = nullptr;
    Sleeper sleeper;
};

// Picks the strategy named by `delivery.strategy` (level1..level4).
// Throws std::invalid_argument for an unknown name or a missing collaborator.
std::unique_ptr<DeliveryService> make_delivery_service(const core::Config& config,
                                                       const DeliveryDependencies& deps);

}
