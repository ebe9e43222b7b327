#include "postrelay/delivery/timeline.hpp"
#include "postrelay/core/logger.hpp"

namespace postrelay::delivery {

std::vector<network::ContentItem> load_timeline(network::HttpClient& client) {
    try {
        return network::wire::decode_timeline(client.get_json("/tweets"));
    } catch (const std::exception& e) {
        LOG_WARN("Failed to fetch timeline: {}", e.what());
        return {};
    }
}

}
