#pragma once

#include "delivery_types.hpp"
#include "../network/http_client.hpp"
#include "../network/wire.hpp"
#include "../queue/upload_job_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace postrelay::delivery {

// Hands posts to the durable job queue. Delivery errors are never reported
// to the caller; they show up only as job state.
class DurableUploader {
public:
    DurableUploader(network::HttpClient& client, queue::UploadJobEngine& engine);

    static StrategyProfile profile();

    std::vector<network::ContentItem> fetch_timeline();
    DeliveryResult submit(const SubmitRequest& request, const ProgressCallback& progress = nullptr);
    std::string status_summary();

    queue::UploadJobEngine& engine() { return engine_; }

private:
    network::HttpClient& client_;
    queue::UploadJobEngine& engine_;
};

}
