#pragma once

#include "transfer_channel.hpp"
#include "../storage/transfer_ledger.hpp"
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace postrelay::transfer {

class ChunkUploadError : public std::runtime_error {
public:
    explicit ChunkUploadError(int status);

    int status() const { return status_; }

private:
    int status_;
};

// Turns the callback-driven TransferChannel into a blocking call per chunk.
//
// Each outstanding task lives in an arena keyed by task id. The temp chunk
// file handed to upload_chunk() belongs to the bridge from that point on and
// is deleted exactly once, when the task reaches its terminal event.
class BackgroundTransferBridge : public TransferChannelDelegate {
public:
    using ProgressHandler = std::function<void(double)>;
    using WakeCompletion = std::function<void()>;

    // The ledger is optional; without it nothing survives a relaunch.
    BackgroundTransferBridge(TransferChannel& channel, storage::TransferLedger* ledger = nullptr);
    ~BackgroundTransferBridge() override;

    BackgroundTransferBridge(const BackgroundTransferBridge&) = delete;
    BackgroundTransferBridge& operator=(const BackgroundTransferBridge&) = delete;

    // Blocks until the channel delivers the task's terminal event.
    // Throws ChunkUploadError on a non-2xx reply, TransportError when no
    // response arrived, or whatever the channel reported.
    network::HttpResponse upload_chunk(const network::HttpRequest& request,
                                       const std::filesystem::path& file,
                                       ProgressHandler on_progress = nullptr);

    void handle_background_wake(const std::string& identifier, WakeCompletion completion);

    // Deletes temp files of restored records the channel no longer knows about.
    std::size_t sweep_orphans();

    std::size_t pending_count() const;
    const std::string& channel_identifier() const { return channel_.identifier(); }

    void on_body_data_sent(TaskId task_id, uint64_t total_sent, uint64_t total_expected) override;
    void on_task_completed(TaskId task_id,
                           std::optional<network::HttpResponse> response,
                           std::exception_ptr error) override;
    void on_events_finished() override;

private:
    struct PendingTransfer {
        std::filesystem::path temp_file;
        std::optional<std::promise<network::HttpResponse>> promise;
        ProgressHandler progress;
    };

    TransferChannel& channel_;
    storage::TransferLedger* ledger_;

    mutable std::mutex mutex_;
    std::map<TaskId, PendingTransfer> pending_;
    WakeCompletion wake_completion_;

    void restore_from_ledger();
    void release(TaskId task_id, const std::filesystem::path& temp_file);
};

}
