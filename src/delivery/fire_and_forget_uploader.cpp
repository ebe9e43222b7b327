#include "postrelay/delivery/fire_and_forget_uploader.hpp"
#include "postrelay/delivery/timeline.hpp"
#include "postrelay/core/logger.hpp"

namespace postrelay::delivery {

FireAndForgetUploader::FireAndForgetUploader(network::HttpClient& client)
    : client_(client) {
}

StrategyProfile FireAndForgetUploader::profile() {
    return StrategyProfile{"Fire and Forget", "level1", false, false};
}

std::vector<network::ContentItem> FireAndForgetUploader::fetch_timeline() {
    return load_timeline(client_);
}

DeliveryResult FireAndForgetUploader::submit(const SubmitRequest& request, const ProgressCallback& progress) {
    if (progress) progress(0.1);

    try {
        client_.post_json("/level1/tweets", network::wire::encode_text_body(request.text));
        LOG_INFO("Level 1 upload sent once");
    } catch (const std::exception& e) {
        LOG_WARN("Level 1 fire-and-forget failed: {}", e.what());
    }

    if (progress) progress(1.0);
    return DeliveryResult();
}

}
