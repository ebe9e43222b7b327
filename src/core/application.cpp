#include "postrelay/core/application.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"

namespace postrelay::core {

Application::Application(const Config& config)
    : config_(config)
    , started_(false)
    , queue_recovered_(false)
    , database_(utils::FileUtils::expand_home(config.get_string("storage.database", "postrelay.db")))
    , offsets_(database_)
    , jobs_(database_)
    , ledger_(database_)
    , queue_pool_(1) {
}

Application::~Application() {
    shutdown();
}

void Application::start() {
    if (started_) {
        return;
    }

    database_.open();
    offsets_.initialize();
    jobs_.initialize();
    ledger_.initialize();

    auto base_url = config_.get_string("server.base_url", "http://localhost:8080");
    auto timeout = std::chrono::milliseconds(config_.get_int("server.timeout_ms", 30000));
    transport_ = std::make_unique<network::BeastHttpTransport>(base_url, timeout);
    client_ = std::make_unique<network::HttpClient>(*transport_);

    // Task ids must not collide with records a previous run left in the ledger.
    channel_ = std::make_unique<transfer::AsioTransferChannel>(
        *transport_, transfer::AsioTransferChannel::DEFAULT_IDENTIFIER, ledger_.max_task_id() + 1);
    bridge_ = std::make_unique<transfer::BackgroundTransferBridge>(*channel_, &ledger_);
    bridge_->sweep_orphans();

    auto pause = std::chrono::milliseconds(config_.get_int("queue.failure_pause_ms", 1500));
    engine_ = std::make_unique<queue::UploadJobEngine>(jobs_, *client_, queue_pool_.get_executor(),
                                                       delivery::default_sleeper(), pause);

    delivery::DeliveryDependencies deps;
    deps.client = client_.get();
    deps.bridge = bridge_.get();
    deps.offsets = &offsets_;
    deps.engine = engine_.get();
    service_ = delivery::make_delivery_service(config_, deps);

    started_ = true;
    LOG_INFO("postrelay ready: server={} database={}", base_url, database_.path().string());
}

size_t Application::recover_queue() {
    if (queue_recovered_) {
        return 0;
    }
    queue_recovered_ = true;
    return engine_->recover_outstanding_jobs();
}

bool Application::wait_for_queue() {
    auto timeout = std::chrono::milliseconds(config_.get_int("queue.drain_timeout_ms", 10000));
    bool idle = engine_->wait_until_idle(timeout);
    if (!idle) {
        LOG_WARN("Durable queue still busy after {}ms; remaining jobs stay persisted", timeout.count());
    }
    return idle;
}

void Application::shutdown() {
    if (!started_) {
        return;
    }
    started_ = false;

    engine_->stop();
    queue_pool_.join();
    channel_->join();
    LOG_INFO("postrelay shut down");
}

}
