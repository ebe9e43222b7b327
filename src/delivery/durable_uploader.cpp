#include "postrelay/delivery/durable_uploader.hpp"
#include "postrelay/delivery/timeline.hpp"

namespace postrelay::delivery {

DurableUploader::DurableUploader(network::HttpClient& client, queue::UploadJobEngine& engine)
    : client_(client), engine_(engine) {
}

StrategyProfile DurableUploader::profile() {
    return StrategyProfile{"Durable State Machine", "level4", false, false};
}

std::vector<network::ContentItem> DurableUploader::fetch_timeline() {
    return load_timeline(client_);
}

DeliveryResult DurableUploader::submit(const SubmitRequest& request, const ProgressCallback& progress) {
    if (progress) progress(0.2);
    engine_.enqueue(request.text);
    if (progress) progress(1.0);
    return DeliveryResult();
}

std::string DurableUploader::status_summary() {
    return engine_.status_summary();
}

}
