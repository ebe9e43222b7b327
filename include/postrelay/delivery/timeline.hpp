#pragma once

#include "../network/http_client.hpp"
#include "../network/wire.hpp"
#include <vector>

namespace postrelay::delivery {

// GET /tweets. Never throws; failures are logged and yield an empty list.
std::vector<network::ContentItem> load_timeline(network::HttpClient& client);

}
