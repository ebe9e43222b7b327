#pragma once

#include "config.hpp"
#include "../delivery/delivery_service.hpp"
#include "../network/http_client.hpp"
#include "../network/http_transport.hpp"
#include "../queue/upload_job_engine.hpp"
#include "../storage/database.hpp"
#include "../storage/job_store.hpp"
#include "../storage/offset_store.hpp"
#include "../storage/transfer_ledger.hpp"
#include "../transfer/background_transfer_bridge.hpp"
#include "../transfer/transfer_channel.hpp"
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <memory>

namespace postrelay::core {

// Owns every long-lived component of one process: the database and its
// stores, the HTTP stack, the single background transfer channel with its
// bridge, the durable queue and the selected delivery strategy.
class Application {
public:
    explicit Application(const Config& config);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Opens storage and wires the components. Throws storage::StorageError or
    // std::invalid_argument on a bad configuration.
    void start();

    // First queue activity of the process: reset interrupted jobs, then drain.
    size_t recover_queue();

    // Waits up to queue.drain_timeout_ms for the durable queue to go idle.
    bool wait_for_queue();

    void shutdown();

    delivery::DeliveryService& delivery() { return *service_; }
    queue::UploadJobEngine& queue() { return *engine_; }
    transfer::BackgroundTransferBridge& bridge() { return *bridge_; }
    network::HttpClient& client() { return *client_; }

private:
    const Config& config_;
    bool started_;
    bool queue_recovered_;

    storage::Database database_;
    storage::OffsetStore offsets_;
    storage::JobStore jobs_;
    storage::TransferLedger ledger_;

    std::unique_ptr<network::BeastHttpTransport> transport_;
    std::unique_ptr<network::HttpClient> client_;
    std::unique_ptr<transfer::AsioTransferChannel> channel_;
    std::unique_ptr<transfer::BackgroundTransferBridge> bridge_;
    boost::asio::thread_pool queue_pool_;
    std::unique_ptr<queue::UploadJobEngine> engine_;
    std::unique_ptr<delivery::DeliveryService> service_;
};

}
