#include "postrelay/transfer/background_transfer_bridge.hpp"
#include "postrelay/core/logger.hpp"
#include <algorithm>
#include <vector>

namespace postrelay::transfer {

ChunkUploadError::ChunkUploadError(int status)
    : std::runtime_error("Chunk upload failed with HTTP " + std::to_string(status) + ".")
    , status_(status) {
}

BackgroundTransferBridge::BackgroundTransferBridge(TransferChannel& channel, storage::TransferLedger* ledger)
    : channel_(channel), ledger_(ledger) {
    restore_from_ledger();
    channel_.set_delegate(this);
}

BackgroundTransferBridge::~BackgroundTransferBridge() {
    channel_.set_delegate(nullptr);
}

void BackgroundTransferBridge::restore_from_ledger() {
    if (!ledger_) {
        return;
    }

    try {
        auto entries = ledger_->list();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : entries) {
            PendingTransfer record;
            record.temp_file = entry.temp_file;
            pending_.emplace(entry.task_id, std::move(record));
        }
        if (!entries.empty()) {
            LOG_INFO("Restored {} background chunk task(s) from previous run", entries.size());
        }
    } catch (const storage::StorageError& e) {
        LOG_WARN("Failed to restore background tasks: {}", e.what());
    }
}

network::HttpResponse BackgroundTransferBridge::upload_chunk(const network::HttpRequest& request,
                                                             const std::filesystem::path& file,
                                                             ProgressHandler on_progress) {
    TaskId task_id = channel_.create_upload_task(request, file);

    std::future<network::HttpResponse> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stale = pending_.find(task_id);
        if (stale != pending_.end()) {
            LOG_WARN("Task id {} reused; dropping stale record", task_id);
            std::error_code ec;
            if (stale->second.temp_file != file) {
                std::filesystem::remove(stale->second.temp_file, ec);
            }
            pending_.erase(stale);
        }

        PendingTransfer record;
        record.temp_file = file;
        record.promise.emplace();
        record.progress = std::move(on_progress);
        future = record.promise->get_future();
        pending_.emplace(task_id, std::move(record));
    }

    if (ledger_) {
        try {
            ledger_->record(task_id, file);
        } catch (const storage::StorageError& e) {
            LOG_WARN("Failed to record background task {}: {}", task_id, e.what());
        }
    }

    LOG_DEBUG("Resuming chunk task {} ({} {})", task_id, request.method, request.path);
    channel_.resume(task_id);

    return future.get();
}

void BackgroundTransferBridge::on_body_data_sent(TaskId task_id, uint64_t total_sent, uint64_t total_expected) {
    ProgressHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(task_id);
        if (it == pending_.end() || !it->second.progress) {
            return;
        }
        handler = it->second.progress;
    }

    if (total_expected == 0) {
        return;
    }
    double fraction = static_cast<double>(total_sent) / static_cast<double>(total_expected);
    handler(std::clamp(fraction, 0.0, 1.0));
}

void BackgroundTransferBridge::on_task_completed(TaskId task_id,
                                                 std::optional<network::HttpResponse> response,
                                                 std::exception_ptr error) {
    PendingTransfer record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(task_id);
        if (it == pending_.end()) {
            LOG_DEBUG("Ignoring completion for unknown task {}", task_id);
            return;
        }
        record = std::move(it->second);
        pending_.erase(it);
    }

    release(task_id, record.temp_file);

    if (!record.promise) {
        LOG_INFO("Orphaned chunk task {} finished after relaunch", task_id);
        return;
    }

    if (error) {
        record.promise->set_exception(error);
    } else if (!response) {
        record.promise->set_exception(std::make_exception_ptr(network::TransportError(
            network::TransportErrorKind::INVALID_RESPONSE, "Missing HTTP response for chunk upload.")));
    } else if (!response->is_success()) {
        record.promise->set_exception(std::make_exception_ptr(ChunkUploadError(response->status)));
    } else {
        record.promise->set_value(std::move(*response));
    }
}

void BackgroundTransferBridge::on_events_finished() {
    WakeCompletion completion;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completion = std::move(wake_completion_);
        wake_completion_ = nullptr;
    }

    if (completion) {
        LOG_DEBUG("Background events drained for {}", channel_.identifier());
        completion();
    }
}

void BackgroundTransferBridge::handle_background_wake(const std::string& identifier, WakeCompletion completion) {
    if (identifier != channel_.identifier()) {
        if (completion) {
            completion();
        }
        return;
    }

    bool run_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.empty()) {
            run_now = true;
        } else {
            wake_completion_ = std::move(completion);
        }
    }

    if (run_now && completion) {
        completion();
    }
}

std::size_t BackgroundTransferBridge::sweep_orphans() {
    std::vector<std::pair<TaskId, std::filesystem::path>> swept;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (!it->second.promise && !channel_.has_task(it->first)) {
                swept.emplace_back(it->first, it->second.temp_file);
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& [task_id, temp_file] : swept) {
        release(task_id, temp_file);
    }
    if (!swept.empty()) {
        LOG_INFO("Swept {} orphaned chunk file(s)", swept.size());
    }
    return swept.size();
}

std::size_t BackgroundTransferBridge::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void BackgroundTransferBridge::release(TaskId task_id, const std::filesystem::path& temp_file) {
    std::error_code ec;
    std::filesystem::remove(temp_file, ec);
    if (ec) {
        LOG_WARN("Failed to delete chunk file {}: {}", temp_file.string(), ec.message());
    }

    if (ledger_) {
        try {
            ledger_->remove(task_id);
        } catch (const storage::StorageError& e) {
            LOG_WARN("Failed to clear background task {}: {}", task_id, e.what());
        }
    }
}

}
