#pragma once

#include "delivery_types.hpp"
#include "../network/http_client.hpp"
#include "../network/wire.hpp"
#include <vector>

namespace postrelay::delivery {

// One POST /level1/tweets per submission. Failures are logged and never surfaced.
class FireAndForgetUploader {
public:
    explicit FireAndForgetUploader(network::HttpClient& client);

    static StrategyProfile profile();

    std::vector<network::ContentItem> fetch_timeline();
    DeliveryResult submit(const SubmitRequest& request, const ProgressCallback& progress = nullptr);

private:
    network::HttpClient& client_;
};

}
